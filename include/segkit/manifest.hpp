// MIT License
//
// Copyright (c) 2018 Michal Siedlaczek
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

//! \file
//! \author     Michal Siedlaczek
//! \copyright  MIT License

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <segkit/deletions.hpp>
#include <segkit/error.hpp>
#include <segkit/io.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/segment_format.hpp>
#include <segkit/types.hpp>

namespace sgk {

using boost::filesystem::path;

struct index_options {
    bool store_positions = false;
};

//! The list of committed segments of an index directory.
/*!
 * Every change to an index (a new segment, deletions, a merge) produces a
 * new manifest with an incremented generation. Writing the manifest is the
 * commit point: files it does not reference are not part of the index.
 */
struct manifest {
    struct segment_entry {
        segment_id id{};
        std::string name{};
        document_t document_count = 0;
        document_t deleted_count = 0;
        std::optional<std::uint64_t> deletion_generation{};

        path segment_file(const path& dir) const
        {
            return dir / (name + segment_format::extension);
        }

        //! Returns the deletion file, if the segment has deletions.
        std::optional<path> deletions_file(const path& dir) const
        {
            if (not deletion_generation) { return std::nullopt; }
            return dir
                / fmt::format("{}_{}{}",
                      name,
                      *deletion_generation,
                      deletions_format::extension);
        }
    };

    std::uint64_t generation = 0;
    std::uint32_t next_segment = 0;
    index_options options{};
    std::vector<segment_entry> segments{};

    struct Fields {
        static constexpr auto Generation = "generation";
        static constexpr auto NextSegment = "next_segment";
        static constexpr auto StorePositions = "store_positions";
        static constexpr auto Segments = "segments";

        static constexpr auto Id = "id";
        static constexpr auto Name = "name";
        static constexpr auto Documents = "documents";
        static constexpr auto Deleted = "deleted";
        static constexpr auto DeletionGeneration = "deletion_generation";
    };

    static constexpr auto file_name = "segments.json";

    static path manifest_path(const path& dir) { return dir / file_name; }

    template<class T>
    static T read_property(const nlohmann::json& properties, std::string_view name)
    {
        if (auto pos = properties.find(std::string(name));
            pos != properties.end())
        {
            try {
                return pos->get<T>();
            } catch (const nlohmann::json::exception& err) {
                throw corrupt_data(
                    fmt::format("invalid property {}: {}", name, err.what()));
            }
        }
        throw corrupt_data(fmt::format("property {} not found", name));
    }

    static manifest read(const path& dir)
    {
        auto file = manifest_path(dir);
        io::enforce_exist(file);
        return read(make_memory_view(io::load_data(file)));
    }

    static manifest read(const memory_view& view)
    {
        std::string_view buffer(view.data(), view.size());
        nlohmann::json jmanifest;
        try {
            jmanifest = nlohmann::json::parse(buffer);
        } catch (const nlohmann::json::parse_error& err) {
            throw corrupt_data(fmt::format("invalid manifest: {}", err.what()));
        }
        return read(jmanifest);
    }

    static manifest read(const nlohmann::json& jmanifest)
    {
        manifest m;
        m.generation = read_property<std::uint64_t>(jmanifest, Fields::Generation);
        m.next_segment =
            read_property<std::uint32_t>(jmanifest, Fields::NextSegment);
        m.options.store_positions =
            read_property<bool>(jmanifest, Fields::StorePositions);
        auto jsegments =
            read_property<nlohmann::json>(jmanifest, Fields::Segments);
        if (not jsegments.is_array()) {
            throw corrupt_data("segments must be an array");
        }
        for (const auto& jsegment : jsegments)
        {
            segment_entry entry;
            entry.id = segment_id(
                read_property<std::uint32_t>(jsegment, Fields::Id));
            entry.name = read_property<std::string>(jsegment, Fields::Name);
            entry.document_count =
                read_property<document_t>(jsegment, Fields::Documents);
            entry.deleted_count =
                read_property<document_t>(jsegment, Fields::Deleted);
            if (auto pos = jsegment.find(Fields::DeletionGeneration);
                pos != jsegment.end())
            {
                entry.deletion_generation =
                    read_property<std::uint64_t>(jsegment, Fields::DeletionGeneration);
            }
            if (entry.deleted_count > entry.document_count) {
                throw corrupt_data(fmt::format(
                    "segment {} has more deleted documents than documents",
                    entry.name));
            }
            m.segments.push_back(std::move(entry));
        }
        return m;
    }

    static nlohmann::json to_json(const manifest& m)
    {
        auto jsegments = nlohmann::json::array();
        for (const auto& entry : m.segments)
        {
            nlohmann::json jsegment = {{Fields::Id, entry.id.as_int()},
                {Fields::Name, entry.name},
                {Fields::Documents, entry.document_count},
                {Fields::Deleted, entry.deleted_count}};
            if (entry.deletion_generation) {
                jsegment[Fields::DeletionGeneration] = *entry.deletion_generation;
            }
            jsegments.push_back(jsegment);
        }
        return {{Fields::Generation, m.generation},
            {Fields::NextSegment, m.next_segment},
            {Fields::StorePositions, m.options.store_positions},
            {Fields::Segments, jsegments}};
    }

    //! Atomically replaces the manifest of the index in `dir`.
    static void write(const manifest& m, const path& dir)
    {
        io::write_durably(manifest_path(dir), to_json(m).dump(4));
    }
};

}  // namespace sgk
