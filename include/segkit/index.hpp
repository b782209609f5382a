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

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <segkit/deletions.hpp>
#include <segkit/error.hpp>
#include <segkit/io.hpp>
#include <segkit/manifest.hpp>
#include <segkit/merger.hpp>
#include <segkit/query.hpp>
#include <segkit/query_executor.hpp>
#include <segkit/score.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/segment_set.hpp>
#include <segkit/segment_writer.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! An index directory: a set of immutable segments with their deletions.
/*!
 * Queries run on snapshots: snapshot() returns the current segment set,
 * which never changes. Every modification (adding a segment, deleting
 * documents, updating, merging) is first committed to disk and then
 * published as a new snapshot, replacing the old one atomically. Snapshots taken before
 * remain valid and unchanged for as long as they are held.
 *
 * Modifications are serialized with a mutex; taking a snapshot never
 * blocks.
 *
 * Directory layout:
 *  - `segments.json`: the manifest;
 *  - `seg_<n>.seg`: segment files;
 *  - `seg_<n>_<generation>.del`: deletion bitmaps.
 */
class index {
public:
    index(const index&) = delete;
    index& operator=(const index&) = delete;
    index(index&&) = delete;
    index& operator=(index&&) = delete;
    ~index() = default;

    //! Creates an empty index in `dir`.
    //!
    //! \throws invalid_state   if `dir` already contains an index
    static std::unique_ptr<index>
    create(const path& dir, index_options options = {})
    {
        if (boost::filesystem::exists(manifest::manifest_path(dir))) {
            throw invalid_state(
                fmt::format("index already exists in {}", dir.string()));
        }
        boost::system::error_code ec;
        boost::filesystem::create_directories(dir, ec);
        if (ec) {
            throw io_failure(fmt::format(
                "cannot create {}: {}", dir.string(), ec.message()));
        }
        manifest m;
        m.options = options;
        manifest::write(m, dir);
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Created index in {}", dir.string());
        }
        return std::unique_ptr<index>(new index(dir, std::move(m), {}, {}));
    }

    //! Opens an existing index, removing files it does not reference.
    //!
    //! \throws io_failure      if the manifest or a segment cannot be read
    //! \throws corrupt_data    if any file of the index is malformed
    static std::unique_ptr<index> open(const path& dir)
    {
        auto m = manifest::read(dir);
        reader_map readers;
        deletion_map deletions;
        for (const auto& entry : m.segments)
        {
            auto reader = segment_reader::open(entry.segment_file(dir));
            if (reader.document_count() != entry.document_count) {
                throw corrupt_data(fmt::format(
                    "segment {} has {} documents but the manifest lists {}",
                    entry.name,
                    reader.document_count(),
                    entry.document_count));
            }
            readers.emplace(entry.id, std::move(reader));
            if (auto file = entry.deletions_file(dir); file) {
                auto deleted = std::make_shared<const deletion_bitmap>(
                    read_deletions(*file));
                if (deleted->size() != entry.document_count
                    || deleted->count() != entry.deleted_count)
                {
                    throw corrupt_data(fmt::format(
                        "deletions of segment {} do not match the manifest",
                        entry.name));
                }
                deletions.emplace(entry.id, std::move(deleted));
            }
        }
        std::unique_ptr<index> idx(
            new index(dir, std::move(m), std::move(readers), std::move(deletions)));
        idx->remove_unreferenced_files();
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Opened index {} at generation {} with {} segments",
                dir.string(),
                idx->manifest_.generation,
                idx->manifest_.segments.size());
        }
        return idx;
    }

    //! Opens the index in `dir`, or creates one if there is none.
    static std::unique_ptr<index>
    open_or_create(const path& dir, index_options options = {})
    {
        if (boost::filesystem::exists(manifest::manifest_path(dir))) {
            return open(dir);
        }
        return create(dir, options);
    }

    //! Returns the current snapshot.
    std::shared_ptr<const segment_set> snapshot() const
    {
        return std::atomic_load(&snapshot_);
    }

    //! Returns a writer configured with the options of this index.
    segment_writer writer() const
    {
        return segment_writer(options_.store_positions);
    }

    //! Flushes the writer into a new segment and publishes it.
    //!
    //! \throws std::invalid_argument   if the writer options differ from
    //!                                 the options of the index
    //! \throws invalid_state           if the writer is not open
    //! \throws io_failure              if the segment cannot be written
    segment_info add_segment(segment_writer&& writer)
    {
        check_writer(writer);
        segment_writer w(std::move(writer));
        std::lock_guard<std::mutex> lock(mutex_);
        auto next = manifest_;
        reader_map added;
        auto info = stage_segment(w, next, added);
        publish(std::move(next), std::move(added));
        return info;
    }

    //! Replaces all live documents containing the term with the documents
    //! of the writer.
    /*!
     * The deletions and the new segment are committed with a single
     * manifest: a snapshot either has both or neither.
     *
     * \throws std::invalid_argument   if the writer options differ from
     *                                 the options of the index
     * \throws invalid_state           if the writer is not open
     * \throws io_failure              if a file cannot be written
     */
    segment_info update_documents(const term& t, segment_writer&& writer)
    {
        check_writer(writer);
        segment_writer w(std::move(writer));
        std::lock_guard<std::mutex> lock(mutex_);
        auto snap = snapshot();
        deletion_lists deleted;
        auto count = collect_term(*snap, t, deleted);
        auto next = manifest_;
        deletion_map updated;
        stage_deletions(*snap, deleted, next, updated);
        reader_map added;
        auto info = stage_segment(w, next, added);
        publish(std::move(next), std::move(added), std::move(updated));
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Replaced {} documents matching {} with {}",
                count,
                t,
                info.document_count);
        }
        return info;
    }

    //! Deletes a document by its global ID in the current snapshot.
    //!
    //! \returns `false` if there is no such live document
    bool delete_document(document_t global)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto snap = snapshot();
        auto segment = snap->segment_for(global);
        if (not segment) { return false; }
        const auto& entry = (*snap)[*segment];
        auto local = global - entry.base;
        if (not entry.reader.is_live(local)) { return false; }
        deletion_lists deleted;
        deleted[entry.id].push_back(local);
        apply_deletions(*snap, deleted);
        return true;
    }

    //! Deletes all live documents containing the term.
    //!
    //! \returns    the number of deleted documents
    std::size_t delete_term(const term& t)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto snap = snapshot();
        deletion_lists deleted;
        auto count = collect_term(*snap, t, deleted);
        if (count > 0) { apply_deletions(*snap, deleted); }
        return count;
    }

    //! Deletes all live documents matching the query.
    //!
    //! eturns    the number of deleted documents
    //! \throws corrupt_data    if a posting list cannot be decoded
    std::size_t delete_query(const query& q)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto snap = snapshot();
        deletion_lists deleted;
        std::size_t count = 0;
        for (const auto& entry : *snap)
        {
            for (const auto& result :
                evaluate(q, entry.reader, score::score_function::none))
            {
                if (entry.reader.is_live(result.document)) {
                    deleted[entry.id].push_back(result.document);
                    ++count;
                }
            }
        }
        if (count > 0) { apply_deletions(*snap, deleted); }
        return count;
    }

    //! Merges all segments into one, dropping deleted documents.
    //!
    //! Global IDs of live documents change: they become consecutive in
    //! the original order. Nothing is done if the index has a single
    //! segment without deletions, or no segments.
    //!
    //! \returns `true` if the segments were merged
    bool merge()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto snap = snapshot();
        bool has_deletions = std::any_of(snap->begin(),
            snap->end(),
            [](const auto& entry) { return entry.reader.has_deletions(); });
        if (snap->empty() || (snap->size() == 1 && not has_deletions)) {
            return false;
        }
        std::vector<segment_reader> sources;
        for (const auto& entry : *snap) { sources.push_back(entry.reader); }
        segment_merger merger(std::move(sources));

        auto next = manifest_;
        next.segments.clear();
        reader_map added;
        if (merger.document_count() > 0)
        {
            segment_id id(next.next_segment++);
            auto name = segment_name(id);
            manifest_.next_segment = next.next_segment;
            auto info = merger.merge(dir_, name);
            added.emplace(id, segment_reader::open(info.file));
            next.segments.push_back(
                {id, name, info.document_count, 0, std::nullopt});
        }
        publish(std::move(next), std::move(added));
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Merged {} segments", snap->size());
        }
        return true;
    }

    //! Returns the bytes of a segment of the current snapshot.
    std::optional<std::vector<char>> segment_blob(segment_id id) const
    {
        auto snap = snapshot();
        if (auto idx = snap->find(id); idx) {
            const auto& bytes = (*snap)[*idx].reader.bytes();
            return std::vector<char>(bytes.begin(), bytes.end());
        }
        return std::nullopt;
    }

    const path& dir() const { return dir_; }
    const index_options& options() const { return options_; }

    //! Returns the generation of the last committed manifest.
    std::uint64_t generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return manifest_.generation;
    }

private:
    using reader_map = std::map<segment_id, segment_reader>;
    using deletion_map =
        std::map<segment_id, std::shared_ptr<const deletion_bitmap>>;
    using deletion_lists = std::map<segment_id, std::vector<document_t>>;

    index(path dir, manifest m, reader_map readers, deletion_map deletions)
        : dir_(std::move(dir)),
          options_(m.options),
          manifest_(std::move(m)),
          readers_(std::move(readers)),
          deletions_(std::move(deletions))
    {
        std::atomic_store(&snapshot_, build_snapshot());
    }

    static std::string segment_name(segment_id id)
    {
        return fmt::format("seg_{}", id.as_int());
    }

    std::shared_ptr<const segment_set> build_snapshot() const
    {
        std::vector<std::pair<segment_id, segment_reader>> segments;
        for (const auto& entry : manifest_.segments)
        {
            std::shared_ptr<const deletion_bitmap> deleted;
            if (auto pos = deletions_.find(entry.id); pos != deletions_.end()) {
                deleted = pos->second;
            }
            segments.emplace_back(
                entry.id, readers_.at(entry.id).with_deletions(deleted));
        }
        return std::make_shared<const segment_set>(std::move(segments));
    }

    void check_writer(const segment_writer& writer) const
    {
        if (writer.store_positions() != options_.store_positions) {
            throw std::invalid_argument(
                "writer and index disagree on storing positions");
        }
    }

    //! Appends the live local documents containing `t` to `deleted`.
    static std::size_t
    collect_term(const segment_set& snap, const term& t, deletion_lists& deleted)
    {
        std::size_t count = 0;
        for (const auto& entry : snap)
        {
            auto postings = entry.reader.term_postings(t);
            if (not postings) { continue; }
            for (const posting& p : *postings) {
                if (entry.reader.is_live(p.document)) {
                    deleted[entry.id].push_back(p.document);
                    ++count;
                }
            }
        }
        return count;
    }

    //! Flushes the writer into a new segment listed in `next`.
    segment_info
    stage_segment(segment_writer& writer, manifest& next, reader_map& added)
    {
        segment_id id(next.next_segment++);
        auto name = segment_name(id);
        manifest_.next_segment = next.next_segment;
        auto info = writer.flush(dir_, name);
        added.emplace(id, segment_reader::open(info.file));
        next.segments.push_back({id, name, info.document_count, 0, std::nullopt});
        return info;
    }

    //! Writes new deletion bitmaps for the given local documents and
    //! publishes them.
    void apply_deletions(const segment_set& snap, const deletion_lists& deleted)
    {
        auto next = manifest_;
        deletion_map updated;
        stage_deletions(snap, deleted, next, updated);
        publish(std::move(next), {}, std::move(updated));
    }

    //! Writes the deletion bitmaps of the next generation and lists them
    //! in `next`.
    void stage_deletions(const segment_set& snap,
        const deletion_lists& deleted,
        manifest& next,
        deletion_map& updated) const
    {
        auto generation = manifest_.generation + 1;
        for (auto& entry : next.segments)
        {
            auto pos = deleted.find(entry.id);
            if (pos == deleted.end()) { continue; }
            const auto& reader = snap[*snap.find(entry.id)].reader;
            auto bitmap = reader.deletions() != nullptr
                ? *reader.deletions()
                : deletion_bitmap(reader.document_count());
            for (auto doc : pos->second) { bitmap.set(doc); }
            entry.deletion_generation = generation;
            entry.deleted_count = static_cast<document_t>(bitmap.count());
            write_deletions(*entry.deletions_file(dir_), bitmap);
            updated.emplace(entry.id,
                std::make_shared<const deletion_bitmap>(std::move(bitmap)));
            if (auto log = spdlog::get("segkit"); log) {
                log->debug("Deleted {} documents from {}",
                    pos->second.size(),
                    entry.name);
            }
        }
    }

    //! Commits the manifest, swaps the snapshot, and removes files
    //! that are no longer referenced.
    /*!
     * `added` and `updated` hold the readers and deletions of the new
     * manifest that are not yet published. They replace the current ones
     * only once the manifest is committed.
     */
    void publish(manifest next, reader_map added = {}, deletion_map updated = {})
    {
        next.generation = manifest_.generation + 1;
        manifest::write(next, dir_);
        manifest_ = std::move(next);

        reader_map readers;
        deletion_map deletions;
        for (const auto& entry : manifest_.segments)
        {
            if (auto pos = added.find(entry.id); pos != added.end()) {
                readers.emplace(entry.id, pos->second);
            } else {
                readers.emplace(entry.id, readers_.at(entry.id));
            }
            if (auto pos = updated.find(entry.id); pos != updated.end()) {
                deletions.emplace(entry.id, pos->second);
            } else if (auto old = deletions_.find(entry.id);
                       old != deletions_.end())
            {
                deletions.emplace(entry.id, old->second);
            }
        }
        readers_ = std::move(readers);
        deletions_ = std::move(deletions);
        std::atomic_store(&snapshot_, build_snapshot());
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Published generation {} with {} segments",
                manifest_.generation,
                manifest_.segments.size());
        }
        remove_unreferenced_files();
    }

    //! Removes segment, deletion, and temporary files not referenced by
    //! the manifest.
    void remove_unreferenced_files() const
    {
        std::vector<path> referenced{manifest::manifest_path(dir_)};
        for (const auto& entry : manifest_.segments)
        {
            referenced.push_back(entry.segment_file(dir_));
            if (auto file = entry.deletions_file(dir_); file) {
                referenced.push_back(*file);
            }
        }
        auto log = spdlog::get("segkit");
        boost::system::error_code ec;
        boost::filesystem::directory_iterator it(dir_, ec);
        for (; not ec && it != boost::filesystem::directory_iterator();
             it.increment(ec))
        {
            const auto& file = it->path();
            auto extension = file.extension().string();
            if (extension != segment_format::extension
                && extension != deletions_format::extension
                && extension != ".tmp")
            {
                continue;
            }
            if (std::find(referenced.begin(), referenced.end(), file)
                != referenced.end())
            {
                continue;
            }
            boost::system::error_code remove_ec;
            boost::filesystem::remove(file, remove_ec);
            if (log) {
                if (remove_ec) {
                    log->warn("Cannot remove {}: {}",
                        file.string(),
                        remove_ec.message());
                } else {
                    log->debug("Removed {}", file.string());
                }
            }
        }
        if (ec && log) {
            log->warn("Cannot list {}: {}", dir_.string(), ec.message());
        }
    }

    path dir_;
    const index_options options_;
    manifest manifest_;
    reader_map readers_;
    deletion_map deletions_;
    std::shared_ptr<const segment_set> snapshot_;
    mutable std::mutex mutex_;
};

}  // namespace sgk
