// ast.hpp - syntax tree node produced by the parser
#pragma once
#include "zerg/token.hpp"
#include <memory>
#include <string>
#include <vector>

namespace zerg {

class AstNode;
using ast_ptr = std::shared_ptr<AstNode>;

// One token plus an ordered list of children. Children are owned through
// ast_ptr; the parent link is a plain back-pointer used only for navigation.
// A node must be appended under at most one parent.
class AstNode {
public:
    AstNode() : token_(root_token()) {}
    explicit AstNode(Token token) : token_(std::move(token)) {}

    AstNode(const AstNode&) = delete;
    AstNode& operator=(const AstNode&) = delete;

    const Token& token() const { return token_; }
    AstNode* parent() const { return parent_; }
    const std::vector<ast_ptr>& children() const { return children_; }

    // Attach `child` as the last child and return *this for chaining.
    AstNode& append(ast_ptr child);

    // Direct (not transitive) membership.
    bool contains(const AstNode& node) const;

    bool is_root() const { return parent_ == nullptr; }
    // True for a root, or for the last child of its parent.
    bool is_last() const;

    // Tree drawing, one node per line:
    //   fn
    //       ├─  main
    //       └─  .
    std::string to_string() const { return render(0); }
    std::string render(int indent) const;

private:
    Token token_;
    AstNode* parent_ = nullptr;
    std::vector<ast_ptr> children_;
};

inline ast_ptr make_node() { return std::make_shared<AstNode>(); }
inline ast_ptr make_node(Token token) { return std::make_shared<AstNode>(std::move(token)); }

inline AstNode& operator<<(AstNode& parent, ast_ptr child) { return parent.append(std::move(child)); }

} // namespace zerg
