// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/task.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace surge::core {

// JSON file holding every known task. Saves go through <file>.tmp and a
// rename so a crash leaves either the old or the new list.
class StateStore {
public:
    explicit StateStore(std::string path);

    [[nodiscard]] std::error_code save(const std::vector<TaskRecord>& records) noexcept;

    // Missing file: empty list. Active states come back Paused.
    [[nodiscard]] std::expected<std::vector<TaskRecord>, std::error_code> load() const noexcept;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::string temp_path() const { return path_ + ".tmp"; }

private:
    std::string path_;
    std::mutex write_mutex_;
};

// Queued, Resolving and Downloading become Paused with downloaded rewound
// to verified; other records pass through
[[nodiscard]] TaskRecord coerce_on_load(TaskRecord record);

void to_json(nlohmann::json& j, const TaskRecord& record);
void from_json(const nlohmann::json& j, TaskRecord& record);

} // namespace surge::core
