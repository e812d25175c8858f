#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace rf_logger
{

struct RenameOp
{
  std::string from;
  std::string to;
};

// Steps to apply, in order: every removal, then every rename. The last rename
// always moves the active file to backup 1.
struct RotationPlan
{
  std::vector<std::string> removals;
  std::vector<RenameOp> renames;
};

// Soft threshold: a single line larger than max_size still fits a fresh file.
constexpr bool should_rotate(size_t current_size, size_t incoming_line_size,
                             size_t max_size)
{
  return current_size + incoming_line_size > max_size;
}

// stem: directory + file name without extension, e.g. "/var/log/app"
std::string active_path(const std::string& stem);
std::string backup_path(const std::string& stem, size_t index);

// existing_backups: suffixes currently on disk, any order, may have gaps.
// Keeps the newest max_files - 1 backups renumbered to 2..k+1, removes the
// rest, then moves the active file to 1.
RotationPlan plan_rotation(const std::string& stem, std::vector<size_t> existing_backups,
                           size_t max_files);

// Suffixes N of every "<file_name>.<N>.log" in directory, ascending.
std::vector<size_t> list_backups(const std::string& directory, const std::string& file_name);

}  // namespace rf_logger
