#pragma once

#include <accountstore/common/critical.hpp>
#include <accountstore/registry/secondary_index.hpp>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace accountstore::registry {

/// Lazy read-back of the records referenced by a secondary index scan.
///
/// Each step takes the primary key from component `primary_component` of the
/// next index entry and loads the record through `reader`. Entries with too
/// few components are skipped. The cursor is single pass; errors from the scan
/// or from `reader` propagate out of `has_next()`/`next()`.
template <typename Record>
class record_cursor final {
 public:
  using reader_t = std::function<Record(const std::string& primary_key)>;

  record_cursor(context_t& context,
                state_iterator_t iterator,
                std::size_t primary_component,
                reader_t reader)
      : context_{context},
        iterator_{std::move(iterator)},
        primary_component_{primary_component},
        reader_{std::move(reader)} {}

  bool has_next() {
    while (!pending_ && iterator_.has_next()) {
      auto [key, value] = iterator_.next();
      auto [name, components] = context_.split_composite_key(key);
      if (components.size() > primary_component_) {
        pending_ = std::move(components[primary_component_]);
      }
    }
    return pending_.has_value();
  }

  Record next() {
    if (!has_next()) {
      accountstore::common::critical("record_cursor::next past the end");
    }
    auto primary_key = std::move(*pending_);
    pending_.reset();
    return reader_(primary_key);
  }

  /// Drain the cursor. Either every record is returned or the first error is
  /// raised.
  std::vector<Record> collect() {
    auto records = std::vector<Record>{};
    while (has_next()) {
      records.push_back(next());
    }
    return records;
  }

 private:
  context_t& context_;
  state_iterator_t iterator_;
  std::size_t primary_component_;
  reader_t reader_;
  std::optional<std::string> pending_;
};

}  // namespace accountstore::registry
