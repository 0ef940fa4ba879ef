// sheetease_references.hpp - SheetEase - Cross-table Reference Checking
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

// Second pass over a finished batch. Nothing here is fatal: the documents
// have already been produced when references are checked.

#ifndef SHEETEASE_REFERENCES_HPP
#define SHEETEASE_REFERENCES_HPP

#include "sheetease_records.hpp"
#include "sheetease_serializer.hpp"

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <unordered_set>

namespace sheetease
{
    enum class reference_error_kind
    {
        missing_target,
        missing_target_field,
        missing_value,
        kind_mismatch,
        declared_type_mismatch
    };

    using reference_error = error<reference_error_kind>;

    enum class scalar_kind
    {
        none,
        number,
        text,
        boolean
    };

    inline std::string to_string(scalar_kind k)
    {
        switch (k)
        {
            case scalar_kind::none:    return "null";
            case scalar_kind::number:  return "number";
            case scalar_kind::text:    return "string";
            case scalar_kind::boolean: return "bool";
        }
        return "null";
    }

    inline scalar_kind kind_of(value const & v)
    {
        if (v.is_number())  return scalar_kind::number;
        if (v.is_string())  return scalar_kind::text;
        if (v.is_boolean()) return scalar_kind::boolean;
        return scalar_kind::none;
    }

    // Loads a table that is not part of the batch, typically its written output.
    using target_loader = std::function<std::optional<value>(std::string const & table)>;

    struct reference_report
    {
        size_t checked = 0;
        size_t skipped = 0;
        size_t failed  = 0;
    };

    using reference_context = context<reference_report, reference_error>;

//========================================================================
// reference_index
//========================================================================

    // Borrows the batch's record sets; they must outlive the index.
    class reference_index
    {
    public:
        explicit reference_index(std::vector<record_set> const & tables, target_loader loader = {})
            : loader_(std::move(loader))
        {
            for (auto const & t : tables)
                batch_[t.table] = &t.document;
        }

        reference_context check(std::vector<reference_item> const & items, export_options const & options = {});

    private:
        struct universe
        {
            bool                            table_found = false;
            bool                            field_found = false;
            std::string                     field;
            scalar_kind                     kind = scalar_kind::none;
            std::unordered_set<std::string> keys;
        };

        value const *     target(std::string const & table);
        universe const &  universe_of(reference_tag const & tag);

        target_loader                               loader_;
        std::map<std::string, value const *>        batch_;
        std::map<std::string, std::optional<value>> loaded_;
        std::map<std::string, universe>             universes_;
    };

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        // Integral numbers compare equal whether stored as int or float.
        inline std::string canonical_key(value const & v)
        {
            if (v.is_number_integer())
                return "n:" + std::to_string(v.get<int64_t>());

            if (v.is_number_float())
            {
                double d = v.get<double>();
                if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 9.2e18)
                    return "n:" + std::to_string(static_cast<int64_t>(d));
                return "n:" + format_number(d);
            }

            if (v.is_string())
                return "s:" + v.get<std::string>();

            if (v.is_boolean())
                return v.get<bool>() ? "b:true" : "b:false";

            return {};
        }

        // id wherever it sits in the record; targets without a scalar id
        // fall back to their first non-container, non-empty field.
        inline std::string default_target_field(value const & document)
        {
            if (!document.is_object() || document.empty())
                return "id";

            auto const & first = document.begin().value();
            if (!first.is_object())
                return "id";

            if (auto id = first.find("id"); id != first.end() && kind_of(*id) != scalar_kind::none)
                return "id";

            for (auto const & [name, v] : first.items())
            {
                if (kind_of(v) != scalar_kind::none && !(v.is_string() && v.get<std::string>().empty()))
                    return name;
            }
            return "id";
        }

        inline scalar_kind declared_kind(type_descriptor const & t)
        {
            auto p = t.scalar();
            if (!p)
                return scalar_kind::none;

            switch (*p)
            {
                case primitive_type::integer:
                case primitive_type::decimal: return scalar_kind::number;
                case primitive_type::boolean: return scalar_kind::boolean;
                case primitive_type::string:  return scalar_kind::text;
            }
            return scalar_kind::none;
        }

        inline bool is_empty_reference(value const & v, export_options const & options)
        {
            if (v.is_number())
            {
                auto key = canonical_key(v);
                return std::any_of(options.empty_int_refs.begin(), options.empty_int_refs.end(),
                    [&](int64_t s) { return key == "n:" + std::to_string(s); });
            }

            if (v.is_string())
            {
                auto const & s = v.get_ref<std::string const &>();
                return std::find(options.empty_string_refs.begin(), options.empty_string_refs.end(), s)
                    != options.empty_string_refs.end();
            }

            return v.is_null();
        }

        // List elements and map values are referenced individually.
        inline std::vector<value const *> referenced_values(reference_item const & item)
        {
            std::vector<value const *> out;
            bool container = (item.declared.kind == type_kind::list && item.val.is_array())
                || (item.declared.kind == type_kind::map && item.val.is_object());

            if (container)
            {
                for (auto it = item.val.begin(); it != item.val.end(); ++it)
                    out.push_back(&*it);
            }
            else
            {
                out.push_back(&item.val);
            }
            return out;
        }
    }

    inline value const * reference_index::target(std::string const & table)
    {
        if (auto it = batch_.find(table); it != batch_.end())
            return it->second;

        auto it = loaded_.find(table);
        if (it == loaded_.end())
        {
            std::optional<value> doc;
            if (loader_)
                doc = loader_(table);
            it = loaded_.emplace(table, std::move(doc)).first;
        }

        return it->second ? &*it->second : nullptr;
    }

    inline reference_index::universe const & reference_index::universe_of(reference_tag const & tag)
    {
        auto const * doc = target(tag.target_table);
        std::string field = tag.target_field
            ? *tag.target_field
            : (doc ? detail::default_target_field(*doc) : std::string("id"));

        auto name = tag.target_table + "/" + field;
        if (auto it = universes_.find(name); it != universes_.end())
            return it->second;

        universe u;
        u.field = field;

        if (doc && doc->is_object())
        {
            u.table_found = true;
            for (auto const & [_, record] : doc->items())
            {
                if (!record.is_object())
                    continue;

                auto f = record.find(field);
                if (f == record.end())
                    continue;

                u.field_found = true;
                auto k = kind_of(*f);
                if (k == scalar_kind::none)
                    continue;

                if (u.kind == scalar_kind::none)
                    u.kind = k;
                u.keys.insert(detail::canonical_key(*f));
            }
        }

        return universes_.emplace(std::move(name), std::move(u)).first->second;
    }

    inline reference_context reference_index::check(std::vector<reference_item> const & items, export_options const & options)
    {
        reference_context out{};
        auto & report = out.result;

        // Per-field findings are reported once per source field.
        std::set<std::string> reported;
        auto once = [&](reference_item const & item, reference_error_kind kind)
        {
            auto name = item.source_table + "/" + item.field + "/" + std::to_string(static_cast<int>(kind));
            return reported.insert(name).second;
        };

        for (auto const & item : items)
        {
            auto const & u = universe_of(item.target);
            auto tag = item.target.tag();
            source_location where{ item.source_table, item.row, npos(), item.field };

            if (!u.table_found)
            {
                if (once(item, reference_error_kind::missing_target))
                {
                    out.errors.push_back({
                        reference_error_kind::missing_target,
                        severity::recoverable,
                        { item.source_table, npos(), npos(), item.field },
                        "reference target table '" + item.target.target_table + "' is not available; " + tag + " not checked"
                    });
                }
                ++report.skipped;
                continue;
            }

            if (!u.field_found)
            {
                if (once(item, reference_error_kind::missing_target_field))
                {
                    out.errors.push_back({
                        reference_error_kind::missing_target_field,
                        severity::recoverable,
                        { item.source_table, npos(), npos(), item.field },
                        "table '" + item.target.target_table + "' has no field '" + u.field + "'; " + tag + " not checked"
                    });
                }
                ++report.skipped;
                continue;
            }

            auto declared = detail::declared_kind(item.declared);
            if (declared != scalar_kind::none && u.kind != scalar_kind::none && declared != u.kind
                && once(item, reference_error_kind::declared_type_mismatch))
            {
                out.errors.push_back({
                    reference_error_kind::declared_type_mismatch,
                    severity::recoverable,
                    { item.source_table, npos(), npos(), item.field },
                    "field typed " + to_string(item.declared) + " references " + tag + " whose '" + u.field +
                        "' values are " + to_string(u.kind)
                });
            }

            for (auto const * v : detail::referenced_values(item))
            {
                if (detail::is_empty_reference(*v, options))
                {
                    ++report.skipped;
                    continue;
                }

                ++report.checked;

                auto k = kind_of(*v);
                if (u.kind != scalar_kind::none && k != u.kind)
                {
                    ++report.failed;
                    out.errors.push_back({
                        reference_error_kind::kind_mismatch,
                        severity::recoverable,
                        where,
                        "value " + v->dump() + " is a " + to_string(k) + " but " + tag + " '" + u.field +
                            "' holds " + to_string(u.kind) + " values"
                    });
                    continue;
                }

                if (u.keys.count(detail::canonical_key(*v)) == 0)
                {
                    ++report.failed;
                    out.errors.push_back({
                        reference_error_kind::missing_value,
                        severity::recoverable,
                        where,
                        "value " + v->dump() + " not found in " + tag
                    });
                }
            }
        }

        return out;
    }

//========================================================================
// Loading targets from written output
//========================================================================

    inline target_loader file_target_loader(std::string folder, export_options const & options)
    {
        return [folder = std::move(folder), pattern = options.json_file_pattern](std::string const & table) -> std::optional<value>
        {
            std::ifstream in(std::filesystem::path(folder) / file_name(pattern, table), std::ios::binary);
            if (!in)
                return std::nullopt;

            std::stringstream buffer;
            buffer << in.rdbuf();

            value doc = value::parse(buffer.str(), nullptr, false);
            if (doc.is_discarded() || !doc.is_object())
                return std::nullopt;
            return doc;
        };
    }

} // namespace sheetease

#endif // SHEETEASE_REFERENCES_HPP
