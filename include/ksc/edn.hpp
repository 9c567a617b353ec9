// Minimal EDN node representation used as the AST interchange format.
#pragma once
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace ksc
{

    struct parse_error : std::runtime_error
    {
        using std::runtime_error::runtime_error;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one EDN form; trailing content is an error.
    node_ptr parse(std::string_view input);

    std::string to_string(const node_ptr &n);

    // Convenience accessors; return empty / nullptr when the node has another shape.
    inline const std::string *symbol_name(const node_ptr &n)
    {
        if (!n || !std::holds_alternative<symbol>(n->data))
            return nullptr;
        return &std::get<symbol>(n->data).name;
    }
    inline const std::vector<node_ptr> *list_elems(const node_ptr &n)
    {
        if (!n || !std::holds_alternative<list>(n->data))
            return nullptr;
        return &std::get<list>(n->data).elems;
    }
    inline const std::vector<node_ptr> *vector_elems(const node_ptr &n)
    {
        if (!n || !std::holds_alternative<vector_t>(n->data))
            return nullptr;
        return &std::get<vector_t>(n->data).elems;
    }

} // namespace ksc
