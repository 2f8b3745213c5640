// Pagination Policy
//
// Story:
// Both registries page their listings the same way: 1-based page numbers and
// a fixed page size map to a contiguous window of the insertion-ordered
// entries. The RPC boundary additionally fills in defaults for requests that
// omit paging fields.
//
// Algorithm:
// - window.start = (page - 1) * page_size, window.size = page_size
// - page must be >= 1; rejecting 0 is the caller's job (see NormalizePage)
// - Computed in 64-bit so large page numbers cannot wrap

#pragma once

#include <cstdint>

namespace broker_admin {

/// A contiguous range of registry positions.
struct Window {
  uint64_t start = 0;
  uint64_t size = 0;
};

/// Defaults applied by the RPC boundary to incoming paging fields.
struct PageDefaults {
  uint32_t default_page_size = 20;
  uint32_t max_page_size = 1000;  // 0 disables the cap
};

/// A page request after defaults were applied.
struct PageRequest {
  uint32_t page = 1;
  uint32_t page_size = 0;
};

/// Computes the window for a 1-based page.
///
/// @param page 1-based page number. Must be >= 1.
/// @param page_size Entries per page. 0 yields an empty window.
Window ComputeWindow(uint32_t page, uint32_t page_size);

/// Applies defaults to client-supplied paging fields.
///
/// page 0 becomes 1, page_size 0 becomes defaults.default_page_size, and
/// page_size is capped at defaults.max_page_size.
PageRequest NormalizePage(uint32_t page, uint32_t page_size,
                          const PageDefaults& defaults);

}  // namespace broker_admin
