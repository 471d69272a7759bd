// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/state_store.hpp>
#include <surge/disk/error.hpp>
#include <surge/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace surge::core {

namespace {

std::string_view mode_name(TransferMode mode) noexcept {
    return mode == TransferMode::single_stream ? "single_stream" : "chunked";
}

} // namespace

//=============================================================================
// Record serialization
//=============================================================================

void to_json(nlohmann::json& j, const TaskRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"url", record.url},
        {"resolved_url", record.resolved_url},
        {"destination", record.destination},
        {"filename", record.filename},
        {"caller_filename", record.caller_filename},
        {"path", record.final_path},
        {"temp_path", record.temp_path},
        {"status", std::string(to_string(record.status))},
        {"raw_downloaded", record.downloaded_bytes},
        {"raw_total", record.total_bytes},
        {"raw_verified", record.verified_bytes},
        {"accepts_ranges", record.accepts_ranges},
        {"mode", std::string(mode_name(record.mode))},
        {"completed_chunks", record.completed_chunks},
        {"chunk_workers", record.chunk_workers},
        {"rules", {{"force_single", record.overrides.force_single_stream},
                   {"max_threads", record.overrides.max_workers}}},
        {"headers", record.headers},
        {"provider", record.provider_hint},
        {"format_id", record.format_id},
        {"error", record.error},
    };
}

void from_json(const nlohmann::json& j, TaskRecord& record) {
    record.id = j.at("id").get<std::string>();
    record.url = j.at("url").get<std::string>();
    record.resolved_url = j.value("resolved_url", std::string{});
    record.destination = j.value("destination", std::string{});
    record.filename = j.value("filename", std::string{});
    record.caller_filename = j.value("caller_filename", false);
    record.final_path = j.value("path", std::string{});
    record.temp_path = j.value("temp_path", std::string{});

    auto status = parse_status(j.value("status", std::string{"Paused"}));
    if (!status) {
        throw std::invalid_argument("unknown status for task " + record.id);
    }
    record.status = *status;

    record.downloaded_bytes = j.value("raw_downloaded", std::uint64_t{0});
    record.total_bytes = j.value("raw_total", std::uint64_t{0});
    record.verified_bytes = j.value("raw_verified", std::uint64_t{0});
    record.accepts_ranges = j.value("accepts_ranges", false);
    record.mode = j.value("mode", std::string{"chunked"}) == "single_stream"
        ? TransferMode::single_stream
        : TransferMode::chunked;
    record.completed_chunks = j.value("completed_chunks", std::set<std::uint32_t>{});
    record.chunk_workers = j.value("chunk_workers", std::uint32_t{0});
    if (auto rules = j.find("rules"); rules != j.end()) {
        record.overrides.force_single_stream = rules->value("force_single", false);
        record.overrides.max_workers = rules->value("max_threads", std::uint32_t{0});
    }
    record.headers = j.value("headers", Headers{});
    record.provider_hint = j.value("provider", std::string{});
    record.format_id = j.value("format_id", std::string{});
    record.error = j.value("error", std::string{});
}

TaskRecord coerce_on_load(TaskRecord record) {
    switch (record.status) {
        case TaskStatus::queued:
        case TaskStatus::resolving:
        case TaskStatus::downloading:
            record.status = TaskStatus::paused;
            record.downloaded_bytes = record.verified_bytes;
            break;
        case TaskStatus::paused:
            record.downloaded_bytes = record.verified_bytes;
            break;
        default:
            break;
    }
    return record;
}

//=============================================================================
// StateStore
//=============================================================================

StateStore::StateStore(std::string path)
    : path_(std::move(path)) {}

std::error_code StateStore::save(const std::vector<TaskRecord>& records) noexcept {
    try {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::filesystem::path p(path_);
        if (p.has_parent_path()) {
            std::error_code dir_ec;
            std::filesystem::create_directories(p.parent_path(), dir_ec);
        }

        auto tmp = temp_path();
        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file << nlohmann::json(records).dump(2) << '\n';
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }
        return disk::rename_over(tmp, path_);
    } catch (const std::exception& e) {
        spdlog::warn("Cannot write state file {}: {}", path_, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<std::vector<TaskRecord>, std::error_code> StateStore::load() const noexcept {
    try {
        std::ifstream file(path_, std::ios::binary);
        if (!file) {
            return std::vector<TaskRecord>{};
        }

        auto j = nlohmann::json::parse(file);
        if (!j.is_array()) {
            return std::unexpected(make_error_code(disk::DiskErrc::corrupt_file));
        }

        std::vector<TaskRecord> records;
        records.reserve(j.size());
        for (const auto& item : j) {
            records.push_back(coerce_on_load(item.get<TaskRecord>()));
        }
        return records;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed state file {}: {}", path_, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::corrupt_file));
    } catch (const std::exception& e) {
        spdlog::warn("Ignoring malformed state file {}: {}", path_, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::corrupt_file));
    }
}

} // namespace surge::core
