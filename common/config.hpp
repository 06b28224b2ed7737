#ifndef MARKTREE_COMMON_CONFIG_HPP
#define MARKTREE_COMMON_CONFIG_HPP

#include <parser/lexer.hpp>
#include <render/html_renderer.hpp>

namespace marktree {

// Everything a run of the pipeline can be tuned with
struct Config {
    marktree::parser::LexerOptions lexer;
    marktree::render::RenderOptions render;
};

}  // namespace marktree

#endif // MARKTREE_COMMON_CONFIG_HPP
