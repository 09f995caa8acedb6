#include "core/model/types.hpp"

#include <filesystem>

#include "core/util/common.hpp"

namespace keyspan {

std::int64_t StorageContext::now() const {
  if (now_unix) {
    return now_unix();
  }
  return util::unix_timestamp_now();
}

std::string StorageContext::path_for(std::string_view file_name) const {
  return (std::filesystem::path{root} / std::string{file_name}).string();
}

}  // namespace keyspan
