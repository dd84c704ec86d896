#include "zerg/ast.hpp"
#include <sstream>

namespace zerg {

AstNode& AstNode::append(ast_ptr child){
    child->parent_ = this;
    children_.push_back(std::move(child));
    return *this;
}

bool AstNode::contains(const AstNode& node) const {
    for(const auto& c : children_){
        if(c.get() == &node) return true;
    }
    return false;
}

bool AstNode::is_last() const {
    if(!parent_) return true;
    return !parent_->children_.empty() && parent_->children_.back().get() == this;
}

std::string AstNode::render(int indent) const {
    std::ostringstream oss;
    if(is_root()){
        oss << token_.display();
    } else {
        oss << std::string(static_cast<size_t>(indent), ' ')
            << (is_last() ? "└─" : "├─") << "  " << token_.display();
    }
    for(const auto& c : children_) oss << '\n' << c->render(indent + 4);
    return oss.str();
}

} // namespace zerg
