/*
 * batch_sink.cpp  Oct 6th, 2026
 *
 * Chunked synchronous flushes with bounded retry and ndjson spill
 *
 */

#include "tcf/batch_sink.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <boost/json.hpp>
#include <spdlog/spdlog.h>

#include "tcf/errors.hpp"

namespace tcf {

BatchSink::BatchSink(Warehouse& warehouse, SinkConfig cfg, Sleeper sleeper)
  : warehouse_(warehouse), cfg_(std::move(cfg)), sleeper_(std::move(sleeper))
{
  if ( cfg_.max_records == 0 ) {
    throw std::invalid_argument("tcf::BatchSink max_records must be greater than zero");
  }
  if ( cfg_.max_flush_attempts == 0 ) {
    cfg_.max_flush_attempts = 1;
  }
  if ( !sleeper_ ) {
    sleeper_ = [](millis d) { std::this_thread::sleep_for(d); };
  }
}

/************ push() **************************************/
/* Appends and flushes full chunks until the buffer is back under both
 * bounds. Remainders stay buffered for the next push or the drain. An
 * empty push with an ack is acked at once.
 */
void
BatchSink::push(std::vector<Record> records, Ack on_loaded)
{
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t first = pushed_seq_;
  for (auto& rec : records) {
    buffered_bytes_ += rec.approx_bytes();
    buffer_.push_back(std::move(rec));
  }
  pushed_seq_ += records.size();

  if ( on_loaded ) {
    if ( pushed_seq_ == first && waiters_.empty() ) {
      on_loaded();
    } else {
      waiters_.push_back(Waiter{first, pushed_seq_, std::move(on_loaded)});
    }
  }

  while ( over_bound_() ) {
    flush_chunk_(take_chunk_());
  }
}

/************ flush() *************************************/
/* Flushes everything buffered, in chunks of at most max_records */
void
BatchSink::flush()
{
  std::lock_guard<std::mutex> lock(mu_);
  while ( !buffer_.empty() ) {
    flush_chunk_(take_chunk_());
  }
}

/************ drain_on_shutdown() *************************/
/* Called unconditionally at the end of a run, early termination included */
void
BatchSink::drain_on_shutdown()
{
  const auto pending = buffered();
  if ( pending > 0 ) {
    spdlog::info("batch sink: draining {} buffered records", pending);
  }
  flush();
}

SinkStats
BatchSink::stats() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

size_t
BatchSink::buffered() const
{
  std::lock_guard<std::mutex> lock(mu_);
  return buffer_.size();
}

bool
BatchSink::over_bound_() const noexcept
{
  if ( buffer_.empty() ) {
    return false;
  }
  return buffer_.size() >= cfg_.max_records || buffered_bytes_ >= cfg_.max_bytes;
}

/* Front of the buffer up to max_records / max_bytes, at least one record */
std::vector<Record>
BatchSink::take_chunk_()
{
  std::vector<Record> chunk;
  size_t bytes{0};
  while ( !buffer_.empty() && chunk.size() < cfg_.max_records ) {
    const size_t next = buffer_.front().approx_bytes();
    if ( !chunk.empty() && bytes + next > cfg_.max_bytes ) {
      break;
    }
    bytes += next;
    chunk.push_back(std::move(buffer_.front()));
    buffer_.pop_front();
  }
  buffered_bytes_ -= std::min(bytes, buffered_bytes_);
  return chunk;
}

/************ flush_chunk_() ******************************/
/* Hands one chunk to the warehouse, retrying with doubling backoff.
 *
 * Throws:
 *   SinkError once attempts are exhausted, after spilling the chunk
 */
void
BatchSink::flush_chunk_(const std::vector<Record>& chunk)
{
  if ( chunk.empty() ) {
    return;
  }

  auto backoff = cfg_.flush_backoff;
  for (size_t attempt{1}; attempt <= cfg_.max_flush_attempts; attempt++) {
    try {
      const auto start = std::chrono::steady_clock::now();
      warehouse_.load(chunk);
      const auto elapsed = std::chrono::duration_cast<millis>(
          std::chrono::steady_clock::now() - start);

      stats_.flushes += 1;
      stats_.records_flushed += chunk.size();
      spdlog::info("batch sink: flushed {} records in {} ms", chunk.size(), elapsed.count());
      break;
    } catch (const std::exception& e) {
      stats_.failed_attempts += 1;
      if ( attempt == cfg_.max_flush_attempts ) {
        const auto spilled = spill_(chunk);
        loaded_seq_ += chunk.size();

        // pushes with records in the spilled chunk stay unacknowledged
        size_t dropped{0};
        while ( !waiters_.empty() && waiters_.front().first < loaded_seq_ ) {
          waiters_.pop_front();
          dropped += 1;
        }
        spdlog::error("batch sink: flush failed after {} attempts, {} records spilled to {}, "
                      "{} pushes not acknowledged", attempt, chunk.size(), spilled, dropped);
        std::throw_with_nested(SinkError("batch sink: flush of " +
                               std::to_string(chunk.size()) + " records failed, spilled to " +
                               spilled));
      }

      spdlog::warn("batch sink: flush attempt {} failed, retrying in {} ms: {}",
                   attempt, backoff.count(), describe(e));
      sleeper_(backoff);
      backoff *= 2;
    }
  }

  loaded_seq_ += chunk.size();
  acknowledge_();
}

/************ acknowledge_() ******************************/
/* Runs, in push order, every ack whose records have all loaded. An ack that
 * throws leaves the rest queued for the next flush.
 */
void
BatchSink::acknowledge_()
{
  while ( !waiters_.empty() && waiters_.front().last <= loaded_seq_ ) {
    auto ack = std::move(waiters_.front().ack);
    waiters_.pop_front();
    ack();
  }
}

/************ spill_() ************************************/
/* Writes one json object per line. Returns the file path, or a note when
 * even the spill failed so the caller's message still says where things
 * stand.
 */
std::string
BatchSink::spill_(const std::vector<Record>& chunk)
{
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(cfg_.spill_dir, ec);

  spill_seq_ += 1;
  const auto path = fs::path(cfg_.spill_dir) /
    ("spill_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
     "_" + std::to_string(spill_seq_) + ".ndjson");

  std::ofstream out(path);
  if ( !out ) {
    return "<unwritable " + path.string() + ">";
  }

  for (const auto& rec : chunk) {
    boost::json::object row{
      {"category_id", rec.category_id},
      {"group_id", rec.group_id},
      {"product_id", rec.product_id},
      {"update_date", rec.update_date},
      {"fields", rec.fields}
    };
    out << boost::json::serialize(row) << '\n';
  }
  out.flush();
  if ( !out ) {
    return "<incomplete " + path.string() + ">";
  }
  return path.string();
}

} // end namespace tcf
