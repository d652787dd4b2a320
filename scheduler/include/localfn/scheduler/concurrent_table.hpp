#ifndef LOCALFN_SCHEDULER_CONCURRENT_TABLE_HPP
#define LOCALFN_SCHEDULER_CONCURRENT_TABLE_HPP

#include <string>

#include <tbb/concurrent_hash_map.h>

namespace localfn::scheduler {

  template <typename Value, typename Key = std::string>
  struct ConcurrentTable {

    // IntelTBB concurrent hash map, with a default string key
    using table_t = oneapi::tbb::concurrent_hash_map<Key, Value>;

    // Exclusive lock on a single entry. We never take the shared
    // const_accessor: every registry operation mutates state.
    using rw_acc_t = typename oneapi::tbb::concurrent_hash_map<Key, Value>::accessor;
  };

} // namespace localfn::scheduler

#endif
