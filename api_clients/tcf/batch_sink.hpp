/*
 * batch_sink.hpp  Oct 6th, 2026
 *
 * Bounded buffer between the fetcher and the warehouse
 *
 */

#ifndef __TCF_BATCH_SINK_HPP
#define __TCF_BATCH_SINK_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "fetch_support.hpp"
#include "warehouse.hpp"

namespace tcf {

struct SinkConfig {
  size_t max_records{500};          // flush bound, also the batch size
  size_t max_bytes{8u << 20};       // flush bound on approximate bytes
  size_t max_flush_attempts{4};
  millis flush_backoff{500};        // doubled per failed attempt
  std::string spill_dir{"data"};    // ndjson of batches that could not load
};

struct SinkStats {
  size_t flushes{0};
  size_t records_flushed{0};
  size_t failed_attempts{0};
};

/************ tcf::BatchSink ******************************/
/* push() buffers and, once a bound is reached, flushes synchronously while
 * still holding the lock. Concurrent pushers block behind the flush, which
 * bounds memory. Batches handed to the warehouse never exceed max_records.
 *
 * A batch that exhausts its attempts is written to spill_dir and then
 * raised as SinkError. Buffered records are never dropped silently.
 *
 * The ack passed with a push runs once the chunk holding the push's last
 * record has loaded, on the flushing thread with the sink locked, so it
 * must not call back into the sink. A push that loses records to a spill
 * is never acked.
 */
class BatchSink {
public:
  using Sleeper = std::function<void(millis)>;
  using Ack = std::function<void()>;

  BatchSink(Warehouse& warehouse, SinkConfig cfg, Sleeper sleeper = {});

  BatchSink(const BatchSink&) = delete;
  BatchSink& operator=(const BatchSink&) = delete;

  void push(std::vector<Record> records, Ack on_loaded = {});
  void flush();
  void drain_on_shutdown();

  /********** getters *************************************/
  SinkStats stats() const;
  size_t buffered() const;

private:
  Warehouse& warehouse_;
  SinkConfig cfg_;
  Sleeper sleeper_;

  mutable std::mutex mu_;
  std::deque<Record> buffer_;
  size_t buffered_bytes_{0};
  SinkStats stats_{};
  size_t spill_seq_{0};

  /* Records are numbered in push order. Each ack waits on [first, last) */
  struct Waiter {
    uint64_t first;
    uint64_t last;
    Ack ack;
  };
  std::deque<Waiter> waiters_;
  uint64_t pushed_seq_{0};
  uint64_t loaded_seq_{0};

  bool over_bound_() const noexcept;
  std::vector<Record> take_chunk_();
  void flush_chunk_(const std::vector<Record>& chunk);
  void acknowledge_();
  std::string spill_(const std::vector<Record>& chunk);
};

} // end namespace tcf

#endif // !__TCF_BATCH_SINK_HPP
