// Specification tree: arena of sign-tagged nodes referenced by NodeId handles
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "hintc/value.hpp"
#include "hintc/classes.hpp"
#include "hintc/errors.hpp"

namespace hintc
{

    using NodeId = uint32_t;

    enum class Sign : uint8_t
    {
        Atomic,
        Union,
        Container,
        Literal,
        Predicate,
        Forward,
        Ignorable
    };

    enum class Arity : uint8_t
    {
        Fixed,    // tuple-like, exactly children.size() positions
        Variadic, // homogeneous elements, one child
        Mapping   // key and value, two children
    };

    const char *sign_name(Sign s);
    const char *arity_name(Arity a);

    struct SpecNode
    {
        Sign sign{Sign::Ignorable};
        ClassId cls{0};                 // Atomic, Container (base class)
        Arity arity{Arity::Variadic};   // Container
        std::vector<NodeId> children;   // Union alternatives, Container element specs
        std::vector<node_ptr> values;   // Literal, first-seen order
        node_ptr predicate;             // Predicate (native_fn node)
        std::string name;               // Predicate name, Forward reference text
        std::string def_name;           // set on the root of a resolved definition
        node_ptr origin;                // raw sub-specification, for diagnostics
    };

    class SpecTree
    {
    public:
        NodeId add(SpecNode n)
        {
            NodeId id = static_cast<NodeId>(nodes_.size());
            nodes_.push_back(std::move(n));
            return id;
        }
        NodeId add_ignorable(node_ptr origin = nullptr)
        {
            SpecNode n;
            n.sign = Sign::Ignorable;
            n.origin = std::move(origin);
            return add(std::move(n));
        }
        NodeId add_atomic(ClassId cls, node_ptr origin = nullptr)
        {
            SpecNode n;
            n.sign = Sign::Atomic;
            n.cls = cls;
            n.origin = std::move(origin);
            return add(std::move(n));
        }

        SpecNode &at(NodeId id) { return nodes_.at(id); }
        const SpecNode &at(NodeId id) const { return nodes_.at(id); }
        size_t size() const { return nodes_.size(); }

        NodeId root() const { return root_; }
        void set_root(NodeId id) { root_ = id; }

        // Throws malformed_container_arity when a container's child count disagrees with its tag.
        void validate_arity(NodeId id) const;

        // EDN-like rendering; resolved definitions below the top are printed by name.
        std::string to_string(NodeId id, const ClassTable &classes) const;
        std::string to_string(const ClassTable &classes) const { return to_string(root_, classes); }

    private:
        std::vector<SpecNode> nodes_;
        NodeId root_{0};
    };

} // namespace hintc
