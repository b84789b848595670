#pragma once

#include <cstddef>

namespace statecore::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

}  // namespace statecore::db
