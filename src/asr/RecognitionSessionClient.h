#pragma once

#include "../app/BridgeError.h"
#include "../app/Config.h"
#include "../audio/AudioTypes.h"
#include "RecognitionBackend.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Audio of one segment as it is being produced. The session appends frames
// and seals; the backend worker drains it in order.
class SegmentTicket {
public:
  explicit SegmentTicket(uint64_t sequence) : sequence_(sequence) {}

  uint64_t sequence() const { return sequence_; }

  void append(const AudioFrame &frame);
  void seal();
  // The owner is gone; the worker stops sending and reports nothing.
  void abandon();
  // The call gave up on this segment; later audio is dropped.
  void interrupt();

  enum class Next { CHUNK, SEALED, ABANDONED, INTERRUPTED };
  // Blocks until a chunk is available, the segment is sealed and fully
  // drained, or it was abandoned or interrupted.
  Next next(std::shared_ptr<const std::vector<char>> &chunk);
  // False when abandoned before the seal.
  bool waitSealed();

  bool abandoned();
  Clock::time_point sealedAt();

private:
  uint64_t sequence_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<const std::vector<char>>> chunks_;
  bool sealed_ = false;
  bool abandoned_ = false;
  bool interrupted_ = false;
  Clock::time_point sealedAt_;
};

// Owns the path from one connection to the recognition service. Segments are
// sent strictly one after another; at most one is in flight, the rest wait
// in a bounded queue.
class RecognitionSessionClient {
public:
  enum class State { IDLE, CONNECTING, STREAMING, CLOSING, FAILED };

  using ResultCallback = std::function<void(const RecognitionResult &)>;
  using FailureCallback = std::function<void(uint64_t sequence, ErrorKind kind,
                                             const std::string &detail)>;
  using DegradedCallback = std::function<void(const std::string &detail)>;

  // fallback may be null; it is used only in synthetic degraded mode.
  RecognitionSessionClient(std::shared_ptr<RecognitionBackend> backend,
                           std::shared_ptr<RecognitionBackend> fallback,
                           const BackendSettings &settings,
                           const std::string &connectionId);
  ~RecognitionSessionClient();

  RecognitionSessionClient(const RecognitionSessionClient &) = delete;
  RecognitionSessionClient &operator=(const RecognitionSessionClient &) = delete;

  // Callbacks run on the worker threads. Set them before open().
  void setResultCallback(ResultCallback cb);
  void setFailureCallback(FailureCallback cb);
  void setDegradedCallback(DegradedCallback cb);

  // Starts the worker on first use; later calls only swap the options used
  // for the next backend call.
  void open(const StreamOptions &options);

  // Null when the queue is full (Busy) or the client is closed.
  std::shared_ptr<SegmentTicket> beginSegment(uint64_t sequence);
  // Convenience for a segment that is already sealed.
  std::shared_ptr<SegmentTicket> send(const AudioSegment &segment);

  size_t queuedSegments() const;
  State state() const;

  // Abandons all segments and cancels the call in flight without waiting.
  void cancel();
  // True once the worker has exited, or when it never started.
  bool stopped() const;

  // Cancels, then waits for the worker. Returns false when the worker did not
  // acknowledge within the grace period and was left behind.
  bool close(std::chrono::milliseconds grace);

  class Core;

private:
  void cancelLocked();

  std::shared_ptr<Core> core_;
  std::thread worker_;
  bool started_ = false;
  bool cancelled_ = false;
  bool released_ = false;
  mutable std::mutex lifecycleMutex_;
};

const char *clientStateName(RecognitionSessionClient::State state);
