#pragma once

#include <cstddef>

namespace market::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

} // namespace market::db
