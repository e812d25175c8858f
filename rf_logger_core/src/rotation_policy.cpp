#include "rf_logger/rotation_policy.hpp"

#include <dirent.h>

#include <algorithm>
#include <cctype>

namespace rf_logger
{

std::string active_path(const std::string& stem) { return stem + ".log"; }

std::string backup_path(const std::string& stem, size_t index)
{
  return stem + "." + std::to_string(index) + ".log";
}

RotationPlan plan_rotation(const std::string& stem, std::vector<size_t> existing_backups,
                           size_t max_files)
{
  RotationPlan plan;

  std::sort(existing_backups.begin(), existing_backups.end());
  existing_backups.erase(std::unique(existing_backups.begin(), existing_backups.end()),
                         existing_backups.end());
  existing_backups.erase(
      std::remove(existing_backups.begin(), existing_backups.end(), size_t{0}),
      existing_backups.end());

  // Slot 1 is reserved for the active file.
  size_t keep = max_files > 0 ? max_files - 1 : 0;
  if (keep > existing_backups.size())
  {
    keep = existing_backups.size();
  }

  for (size_t i = existing_backups.size(); i > keep; --i)
  {
    plan.removals.push_back(backup_path(stem, existing_backups[i - 1]));
  }

  // Kept backup at rank j (0-based) goes to suffix j + 2. The contiguous
  // prefix 1..p shifts up and must be moved highest first; anything after a
  // gap moves down (or stays) and must be moved lowest first.
  size_t prefix = 0;
  while (prefix < keep && existing_backups[prefix] == prefix + 1)
  {
    ++prefix;
  }

  for (size_t j = prefix; j < keep; ++j)
  {
    size_t from = existing_backups[j];
    size_t to = j + 2;
    if (from != to)
    {
      plan.renames.push_back({backup_path(stem, from), backup_path(stem, to)});
    }
  }

  for (size_t j = prefix; j > 0; --j)
  {
    plan.renames.push_back({backup_path(stem, j), backup_path(stem, j + 1)});
  }

  if (max_files > 0)
  {
    plan.renames.push_back({active_path(stem), backup_path(stem, 1)});
  }
  return plan;
}

std::vector<size_t> list_backups(const std::string& directory, const std::string& file_name)
{
  std::vector<size_t> result;

  DIR* dir = ::opendir(directory.c_str());
  if (!dir) return result;

  std::string prefix = file_name + ".";
  std::string suffix = ".log";

  struct dirent* ent;
  while ((ent = ::readdir(dir)) != nullptr)
  {
    std::string name(ent->d_name);
    if (name.size() <= prefix.size() + suffix.size()) continue;
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

    std::string digits =
        name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (digits.empty() || digits.size() > 9 || digits[0] == '0') continue;
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
    {
      continue;
    }
    result.push_back(static_cast<size_t>(std::stoul(digits)));
  }
  ::closedir(dir);

  std::sort(result.begin(), result.end());
  return result;
}

}  // namespace rf_logger
