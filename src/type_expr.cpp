#include "pickler/type_expr.hpp"

namespace pickler {

TypeExpr::TypeExpr(Kind kind, std::vector<TypeExpr> children)
    : kind_(kind), children_(std::move(children)) {}

TypeExpr TypeExpr::array(TypeExpr element) {
    std::vector<TypeExpr> children;
    children.push_back(std::move(element));
    return TypeExpr(Kind::Array, std::move(children));
}

TypeExpr TypeExpr::list(TypeExpr element) {
    std::vector<TypeExpr> children;
    children.push_back(std::move(element));
    return TypeExpr(Kind::List, std::move(children));
}

TypeExpr TypeExpr::optional(TypeExpr element) {
    std::vector<TypeExpr> children;
    children.push_back(std::move(element));
    return TypeExpr(Kind::Optional, std::move(children));
}

TypeExpr TypeExpr::map(TypeExpr key, TypeExpr value) {
    std::vector<TypeExpr> children;
    children.push_back(std::move(key));
    children.push_back(std::move(value));
    return TypeExpr(Kind::Map, std::move(children));
}

TypeExpr TypeExpr::value(ValueKind kind, std::string type_name, bool boxed, bool same_type) {
    TypeExpr expr(Kind::Value, {});
    expr.value_kind_ = kind;
    expr.type_name_ = std::move(type_name);
    expr.boxed_ = boxed;
    expr.same_type_ = same_type;
    return expr;
}

const TypeExpr& TypeExpr::element() const {
    if (kind_ == Kind::Value || kind_ == Kind::Map) {
        throw Error("TypeExpr::element() called on a node without a single element");
    }
    return children_[0];
}

const TypeExpr& TypeExpr::key() const {
    if (kind_ != Kind::Map) {
        throw Error("TypeExpr::key() called on a non-map node");
    }
    return children_[0];
}

const TypeExpr& TypeExpr::mapped() const {
    if (kind_ != Kind::Map) {
        throw Error("TypeExpr::mapped() called on a non-map node");
    }
    return children_[1];
}

std::string TypeExpr::to_tree_string() const {
    switch (kind_) {
        case Kind::Array:
            return "ARRAY(" + children_[0].to_tree_string() + ")";
        case Kind::List:
            return "LIST(" + children_[0].to_tree_string() + ")";
        case Kind::Optional:
            return "OPTIONAL(" + children_[0].to_tree_string() + ")";
        case Kind::Map:
            return "MAP(" + children_[0].to_tree_string() + ", " +
                   children_[1].to_tree_string() + ")";
        case Kind::Value:
            break;
    }
    return type_name_;
}

} // namespace pickler
