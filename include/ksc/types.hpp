// Interned type catalog for KSC lowering.
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <tuple>
#include <stdexcept>

namespace ksc
{

    using TypeId = uint32_t;

    struct Type
    {
        enum class Kind
        {
            Number,
            Int32,
            Bool,
            Void,
            Function,
            Struct,
            List
        } kind;
        std::string name;           // canonical, unique per type
        std::vector<TypeId> params; // Function params / Struct fields
        TypeId ret{0};              // Function
        TypeId elem{0};             // List
    };

    class TypeContext
    {
    public:
        TypeContext()
        { // builtin ids are stable: Number=0, Int32=1, Bool=2, Void=3
            add_type(Type{Type::Kind::Number, "Number", {}, 0, 0});
            add_type(Type{Type::Kind::Int32, "Int32", {}, 0, 0});
            add_type(Type{Type::Kind::Bool, "Bool", {}, 0, 0});
            add_type(Type{Type::Kind::Void, "Void", {}, 0, 0});
        }

        TypeId number() const { return 0; }
        TypeId int32() const { return 1; }
        TypeId boolean() const { return 2; }
        TypeId void_type() const { return 3; }

        TypeId get_function(const std::vector<TypeId> &params, TypeId ret)
        {
            auto key = std::make_tuple(params, ret);
            auto it = fn_cache_.find(key);
            if (it != fn_cache_.end())
                return it->second;
            std::string n = "fn(";
            for (size_t i = 0; i < params.size(); ++i)
            {
                if (i)
                    n += ", ";
                n += name(params[i]);
            }
            n += ") -> " + name(ret);
            TypeId id = add_type(Type{Type::Kind::Function, std::move(n), params, ret, 0});
            fn_cache_[key] = id;
            return id;
        }
        // Struct names are nominal: the first definition of a name wins.
        TypeId get_struct(const std::string &name, const std::vector<TypeId> &fields)
        {
            auto it = struct_cache_.find(name);
            if (it != struct_cache_.end())
                return it->second;
            TypeId id = add_type(Type{Type::Kind::Struct, name, fields, 0, 0});
            struct_cache_[name] = id;
            return id;
        }
        TypeId get_list(TypeId elem)
        {
            auto it = list_cache_.find(elem);
            if (it != list_cache_.end())
                return it->second;
            TypeId id = add_type(Type{Type::Kind::List, "[" + name(elem) + "]", {}, 0, elem});
            list_cache_[elem] = id;
            return id;
        }

        const Type &at(TypeId id) const { return types_.at(id); }
        const std::string &name(TypeId id) const { return at(id).name; }
        Type::Kind kind(TypeId id) const { return at(id).kind; }
        size_t size() const { return types_.size(); }

        bool is_void(TypeId id) const { return kind(id) == Type::Kind::Void; }
        bool is_numeric(TypeId id) const { return kind(id) == Type::Kind::Number || kind(id) == Type::Kind::Int32; }
        // Types a NumberLiteral can be materialized as.
        bool is_scalar(TypeId id) const { return is_numeric(id) || kind(id) == Type::Kind::Bool; }

    private:
        struct FnKeyHash
        {
            size_t operator()(const std::tuple<std::vector<TypeId>, TypeId> &k) const noexcept
            {
                size_t h = std::hash<TypeId>{}(std::get<1>(k));
                for (auto t : std::get<0>(k))
                    h ^= (std::hash<TypeId>{}(t) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2));
                return h;
            }
        };

        TypeId add_type(Type t)
        {
            TypeId id = static_cast<TypeId>(types_.size());
            types_.push_back(std::move(t));
            return id;
        }

        std::vector<Type> types_;
        std::unordered_map<std::tuple<std::vector<TypeId>, TypeId>, TypeId, FnKeyHash> fn_cache_;
        std::unordered_map<std::string, TypeId> struct_cache_;
        std::unordered_map<TypeId, TypeId> list_cache_;
    };

} // namespace ksc
