// Class registry backing instance-of checks (builtin value kinds + user tagged classes)
#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <algorithm>
#include "hintc/value.hpp"
#include "hintc/errors.hpp"

namespace hintc
{

    using ClassId = uint32_t;

    // Seeded in this order; ids are stable across runs.
    enum class Builtin : ClassId
    {
        Any,
        Nothing,
        Nil,
        Bool,
        Int,
        Float,
        Number,
        String,
        Keyword,
        Symbol,
        List,
        Vector,
        Set,
        Map,
        Seq,
        Coll,
        Tagged,
        Callable
    };

    constexpr ClassId class_id(Builtin b) { return static_cast<ClassId>(b); }

    struct ClassInfo
    {
        std::string name;
        std::vector<ClassId> parents;
        std::vector<ClassId> ancestors; // sorted, includes the class itself
        bool builtin{false};
    };

    class ClassTable
    {
    public:
        ClassTable()
        {
            const ClassId any = class_id(Builtin::Any);
            add_class("any", {}, true);
            add_class("nothing", {any}, true);
            add_class("nil", {any}, true);
            add_class("bool", {any}, true);
            add_class("int", {class_id(Builtin::Number)}, true);
            add_class("float", {class_id(Builtin::Number)}, true);
            add_class("number", {any}, true);
            add_class("string", {any}, true);
            add_class("keyword", {any}, true);
            add_class("symbol", {any}, true);
            add_class("list", {class_id(Builtin::Seq), class_id(Builtin::Coll)}, true);
            add_class("vector", {class_id(Builtin::Seq), class_id(Builtin::Coll)}, true);
            add_class("set", {class_id(Builtin::Coll)}, true);
            add_class("map", {any}, true);
            add_class("seq", {any}, true);
            add_class("coll", {any}, true);
            add_class("tagged", {any}, true);
            add_class("callable", {any}, true);
            // int/float/list/vector/set were seeded before their abstract parents existed
            for (ClassId id = 0; id < classes_.size(); ++id)
                compute_ancestors(id);
        }

        // Register a user class instantiated by tagged values `#name ...`.
        // Parents must be user classes or `tagged`; every user class descends from `tagged`.
        ClassId define_class(const std::string &name, const std::vector<std::string> &parent_names = {})
        {
            if (name_index_.count(name))
                throw hint_error(codes::name_clash, "class '" + name + "' is already defined");
            std::vector<ClassId> parents;
            for (auto &pn : parent_names)
            {
                auto p = lookup(pn);
                if (!p)
                    throw hint_error(codes::bad_parent, "unknown parent class '" + pn + "' for '" + name + "'");
                if (classes_[*p].builtin && *p != class_id(Builtin::Tagged))
                    throw hint_error(codes::bad_parent, "class '" + name + "' cannot derive from builtin '" + pn + "'");
                parents.push_back(*p);
            }
            if (parents.empty())
                parents.push_back(class_id(Builtin::Tagged));
            ClassId id = add_class(name, std::move(parents), false);
            compute_ancestors(id);
            return id;
        }

        std::optional<ClassId> lookup(const std::string &name) const
        {
            auto it = name_index_.find(name);
            if (it == name_index_.end())
                return std::nullopt;
            return it->second;
        }

        const ClassInfo &at(ClassId id) const { return classes_.at(id); }
        const std::string &name(ClassId id) const { return at(id).name; }
        size_t size() const { return classes_.size(); }

        // Most derived class of a value. Never Nothing, never an abstract builtin.
        ClassId class_of(const node &v) const
        {
            switch (v.data.index())
            {
            case 0: return class_id(Builtin::Nil);
            case 1: return class_id(Builtin::Bool);
            case 2: return class_id(Builtin::Int);
            case 3: return class_id(Builtin::Float);
            case 4: return class_id(Builtin::String);
            case 5: return class_id(Builtin::Keyword);
            case 6: return class_id(Builtin::Symbol);
            case 7: return class_id(Builtin::List);
            case 8: return class_id(Builtin::Vector);
            case 9: return class_id(Builtin::Set);
            case 10: return class_id(Builtin::Map);
            case 11:
            {
                auto it = name_index_.find(std::get<tagged_value>(v.data).tag.name);
                if (it != name_index_.end() && !classes_[it->second].builtin)
                    return it->second;
                return class_id(Builtin::Tagged);
            }
            case 12: return class_id(Builtin::Callable);
            }
            return class_id(Builtin::Any);
        }

        bool is_subclass(ClassId cls, ClassId base) const
        {
            if (base == class_id(Builtin::Any))
                return true;
            const auto &anc = classes_[cls].ancestors;
            return std::binary_search(anc.begin(), anc.end(), base);
        }

        bool is_instance(const node &v, ClassId base) const { return is_subclass(class_of(v), base); }

    private:
        std::vector<ClassInfo> classes_;
        std::unordered_map<std::string, ClassId> name_index_;

        ClassId add_class(std::string name, std::vector<ClassId> parents, bool builtin)
        {
            ClassId id = static_cast<ClassId>(classes_.size());
            name_index_[name] = id;
            ClassInfo info;
            info.name = std::move(name);
            info.parents = std::move(parents);
            info.builtin = builtin;
            classes_.push_back(std::move(info));
            return id;
        }

        void compute_ancestors(ClassId id)
        {
            std::vector<ClassId> out{id};
            std::vector<ClassId> work = classes_[id].parents;
            while (!work.empty())
            {
                ClassId c = work.back();
                work.pop_back();
                if (std::find(out.begin(), out.end(), c) != out.end())
                    continue;
                out.push_back(c);
                for (ClassId p : classes_[c].parents)
                    work.push_back(p);
            }
            std::sort(out.begin(), out.end());
            classes_[id].ancestors = std::move(out);
        }
    };

} // namespace hintc
