// dml/basic/source_location.cpp - Source registry implementation
#include "dml/basic/source_location.hpp"

#include <utility>

namespace dml
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_offsets_.push_back(0);
  for (uint32_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(i + 1);
    }
  }
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }
  const uint32_t begin = line_offsets_[line_index];
  uint32_t end = (line_index + 1 < line_offsets_.size())
                   ? line_offsets_[line_index + 1]
                   : static_cast<uint32_t>(content_.size());
  while (end > begin && (content_[end - 1] == '\n' || content_[end - 1] == '\r')) {
    --end;
  }
  return std::string_view(content_).substr(begin, end - begin);
}

FileId SourceRegistry::add_file(const std::filesystem::path & path, std::string content)
{
  for (uint32_t i = 0; i < files_.size(); ++i) {
    if (files_[i].path() == path) {
      if (!content.empty()) {
        files_[i] = SourceFile(path, std::move(content));
      }
      return FileId{i};
    }
  }
  files_.emplace_back(path, std::move(content));
  return FileId{static_cast<uint32_t>(files_.size() - 1)};
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return &files_[id.value];
}

std::filesystem::path SourceRegistry::get_path(FileId id) const
{
  const SourceFile * f = get_file(id);
  return f ? f->path() : std::filesystem::path("<unknown>");
}

}  // namespace dml
