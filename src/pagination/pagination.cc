// Pagination Policy - Implementation
//
// See pagination.h for the Story and algorithm description.

#include "pagination.h"

namespace broker_admin {

Window ComputeWindow(uint32_t page, uint32_t page_size) {
  Window window;
  window.start = (static_cast<uint64_t>(page) - 1) * page_size;
  window.size = page_size;
  return window;
}

PageRequest NormalizePage(uint32_t page, uint32_t page_size,
                          const PageDefaults& defaults) {
  PageRequest request;
  request.page = page == 0 ? 1 : page;
  request.page_size = page_size == 0 ? defaults.default_page_size : page_size;
  if (defaults.max_page_size > 0 &&
      request.page_size > defaults.max_page_size) {
    request.page_size = defaults.max_page_size;
  }
  return request;
}

}  // namespace broker_admin
