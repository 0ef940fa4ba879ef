// sheetease_serializer.hpp - SheetEase - Serializer and Artifact Writer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef SHEETEASE_SERIALIZER_HPP
#define SHEETEASE_SERIALIZER_HPP

#include "sheetease_config.hpp"
#include "sheetease_describe.hpp"
#include "sheetease_records.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace sheetease
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    std::string render_json(value const & v, int indent = 4);
    std::string render_document(record_set const & set, export_options const & options = {});
    std::string render_description(table_description const & d, export_options const & options = {});
    std::string render_enum(enum_description const & d, export_options const & options = {});

    value to_json(table_description const & d);
    value to_json(enum_description const & d);

    // "{name}Config.json" + "Hero" -> "HeroConfig.json"
    inline std::string file_name(std::string_view pattern, std::string_view name)
    {
        std::string out(pattern);
        for (auto pos = out.find("{name}"); pos != std::string::npos; pos = out.find("{name}", pos + name.size()))
            out.replace(pos, 6, name);
        return out;
    }

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        class description_serializer
        {
        public:
            value serialize(table_description const & d)
            {
                value out = value::object();
                out["name"]        = d.name;
                out["info_type"]   = d.info_type;
                out["access_type"] = d.access_type;
                out["variant"]     = to_string(d.variant);

                if (d.composite_multiplier)
                {
                    out["composite_multiplier"] = *d.composite_multiplier;
                    out["key1"] = d.key1_name;
                    out["key2"] = d.key2_name;
                }

                out["properties"] = value::array();
                for (auto const & p : d.properties)
                    out["properties"].push_back(serialize_property(p));

                if (d.keys_enum)
                    out["keys_enum"] = serialize(*d.keys_enum);

                return out;
            }

            value serialize(enum_description const & d)
            {
                value out = value::object();
                out["name"]    = d.name;
                out["members"] = value::array();

                for (auto const & m : d.members)
                {
                    value member = value::object();
                    member["name"]  = m.name;
                    member["value"] = m.value;
                    if (!m.remark.empty())
                        member["remark"] = m.remark;
                    out["members"].push_back(std::move(member));
                }

                return out;
            }

        private:
            value serialize_property(property_description const & p)
            {
                value out = value::object();
                out["name"]    = p.name;
                out["type"]    = p.type_name;
                out["summary"] = p.summary;
                if (p.reference)
                    out["reference"] = p.reference->tag();
                return out;
            }
        };

        inline value sorted_record(value const & record)
        {
            if (!record.is_object())
                return record;

            std::map<std::string, value const *> by_name;
            for (auto it = record.begin(); it != record.end(); ++it)
                by_name.emplace(it.key(), &it.value());

            value out = value::object();
            for (auto const & [name, v] : by_name)
                out[name] = *v;
            return out;
        }
    }

    inline std::string render_json(value const & v, int indent)
    {
        return v.dump(indent, ' ', false, value::error_handler_t::replace) + "\n";
    }

    inline std::string render_document(record_set const & set, export_options const & options)
    {
        if (!options.sort_keys)
            return render_json(set.document, options.indent);

        // Record order stays row order; only fields inside a record are sorted.
        value doc = value::object();
        for (auto it = set.document.begin(); it != set.document.end(); ++it)
            doc[it.key()] = detail::sorted_record(it.value());
        return render_json(doc, options.indent);
    }

    inline value to_json(table_description const & d)
    {
        return detail::description_serializer{}.serialize(d);
    }

    inline value to_json(enum_description const & d)
    {
        return detail::description_serializer{}.serialize(d);
    }

    inline std::string render_description(table_description const & d, export_options const & options)
    {
        return render_json(to_json(d), options.indent);
    }

    inline std::string render_enum(enum_description const & d, export_options const & options)
    {
        return render_json(to_json(d), options.indent);
    }

//========================================================================
// Artifact writer
//========================================================================

    enum class write_status
    {
        written,
        unchanged,
        planned,    // dry run
        failed
    };

    inline std::string to_string(write_status s)
    {
        switch (s)
        {
            case write_status::written:   return "written";
            case write_status::unchanged: return "unchanged";
            case write_status::planned:   return "planned";
            case write_status::failed:    return "failed";
        }
        return "failed";
    }

    struct artifact
    {
        std::filesystem::path path;
        write_status          status = write_status::failed;
        std::string           message;
    };

    class artifact_writer
    {
    public:
        artifact_writer(bool diff_only, bool dry_run)
            : diff_only_(diff_only)
            , dry_run_(dry_run)
        {}

        artifact const & write(std::filesystem::path const & path, std::string const & text)
        {
            artifacts_.push_back(store(path, text));
            return artifacts_.back();
        }

        std::vector<artifact> const & artifacts() const noexcept { return artifacts_; }

        size_t count(write_status s) const
        {
            return static_cast<size_t>(std::count_if(artifacts_.begin(), artifacts_.end(),
                [s](artifact const & a) { return a.status == s; }));
        }

    private:
        artifact store(std::filesystem::path const & path, std::string const & text) const
        {
            if (diff_only_ && same_content(path, text))
                return { path, write_status::unchanged, {} };

            if (dry_run_)
                return { path, write_status::planned, {} };

            std::error_code ec;
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path(), ec);
                if (ec)
                    return { path, write_status::failed, "cannot create '" + path.parent_path().string() + "': " + ec.message() };
            }

            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out)
                return { path, write_status::failed, "cannot open for writing" };

            out << text;
            out.close();
            if (!out)
                return { path, write_status::failed, "write failed" };

            return { path, write_status::written, {} };
        }

        static bool same_content(std::filesystem::path const & path, std::string const & text)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in)
                return false;

            std::stringstream buffer;
            buffer << in.rdbuf();
            return buffer.str() == text;
        }

        bool                  diff_only_;
        bool                  dry_run_;
        std::vector<artifact> artifacts_;
    };

} // namespace sheetease

#endif // SHEETEASE_SERIALIZER_HPP
