#include "RecognitionSessionClient.h"
#include "../app/Logger.h"
#include <algorithm>

void SegmentTicket::append(const AudioFrame &frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sealed_ || abandoned_ || interrupted_)
    return;
  chunks_.push_back(frame.data);
  cv_.notify_all();
}

void SegmentTicket::seal() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sealed_)
    return;
  sealed_ = true;
  sealedAt_ = Clock::now();
  cv_.notify_all();
}

void SegmentTicket::abandon() {
  std::lock_guard<std::mutex> lock(mutex_);
  abandoned_ = true;
  chunks_.clear();
  cv_.notify_all();
}

void SegmentTicket::interrupt() {
  std::lock_guard<std::mutex> lock(mutex_);
  interrupted_ = true;
  chunks_.clear();
  cv_.notify_all();
}

SegmentTicket::Next
SegmentTicket::next(std::shared_ptr<const std::vector<char>> &chunk) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] {
    return abandoned_ || interrupted_ || sealed_ || !chunks_.empty();
  });
  if (abandoned_)
    return Next::ABANDONED;
  if (interrupted_)
    return Next::INTERRUPTED;
  if (!chunks_.empty()) {
    chunk = std::move(chunks_.front());
    chunks_.pop_front();
    return Next::CHUNK;
  }
  return Next::SEALED;
}

bool SegmentTicket::waitSealed() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return abandoned_ || interrupted_ || sealed_; });
  return !abandoned_ && !interrupted_;
}

bool SegmentTicket::abandoned() {
  std::lock_guard<std::mutex> lock(mutex_);
  return abandoned_;
}

Clock::time_point SegmentTicket::sealedAt() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sealedAt_;
}

const char *clientStateName(RecognitionSessionClient::State state) {
  switch (state) {
  case RecognitionSessionClient::State::IDLE:
    return "Idle";
  case RecognitionSessionClient::State::CONNECTING:
    return "Connecting";
  case RecognitionSessionClient::State::STREAMING:
    return "Streaming";
  case RecognitionSessionClient::State::CLOSING:
    return "Closing";
  case RecognitionSessionClient::State::FAILED:
    return "Failed";
  }
  return "Unknown";
}

// Everything the worker touches lives here, so a worker that outlives its
// client (ignored cancellation) never reaches freed memory.
class RecognitionSessionClient::Core {
public:
  Core(std::shared_ptr<RecognitionBackend> backend,
       std::shared_ptr<RecognitionBackend> fallback,
       const BackendSettings &settings, const std::string &connectionId)
      : backend_(std::move(backend)), fallback_(std::move(fallback)),
        settings_(settings), connectionId_(connectionId) {}

  void run();
  void cancel();
  bool waitExited(std::chrono::milliseconds grace);

  std::shared_ptr<SegmentTicket> enqueue(uint64_t sequence);
  size_t queued();
  State state() const { return state_.load(); }

  ResultCallback resultCb_;
  FailureCallback failureCb_;
  DegradedCallback degradedCb_;

  std::mutex mutex_;
  StreamOptions options_;

private:
  // Per backend call bookkeeping shared with that call's reader thread.
  struct Call {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<RecognitionResult> finals;
    bool answered = false;
    bool expired = false; // nothing came back in time
    bool ended = false;
    bool closed = false;
  };

  void process(const std::shared_ptr<SegmentTicket> &ticket);
  std::unique_ptr<RecognitionStream> connect(const StreamOptions &options,
                                             std::string &error,
                                             std::chrono::milliseconds &stalled);
  void readLoop(RecognitionStream *stream, std::shared_ptr<Call> call,
                uint64_t sequence);
  void watchFirstResult(RecognitionStream *stream, std::shared_ptr<Call> call,
                        std::shared_ptr<SegmentTicket> ticket,
                        Clock::time_point deadline);
  bool pump(RecognitionStream &stream, SegmentTicket &ticket, bool incremental);
  void finishCall(RecognitionStream &stream, std::thread &reader,
                  std::thread &watchdog, const std::shared_ptr<Call> &call);
  bool sleepFor(std::chrono::milliseconds delay);
  void setState(State next);
  void fail(uint64_t sequence, ErrorKind kind, const std::string &detail);
  static RecognitionResult merge(std::vector<RecognitionResult> finals);

  std::shared_ptr<RecognitionBackend> backend_;
  std::shared_ptr<RecognitionBackend> fallback_;
  BackendSettings settings_;
  std::string connectionId_;

  std::atomic<State> state_{State::IDLE};
  std::condition_variable cv_;
  std::deque<std::shared_ptr<SegmentTicket>> queue_;
  std::shared_ptr<SegmentTicket> current_;
  RecognitionStream *currentStream_ = nullptr;
  bool cancelled_ = false;
  bool degraded_ = false;

  std::mutex exitMutex_;
  std::condition_variable exitCv_;
  bool exited_ = false;
};

void RecognitionSessionClient::Core::setState(State next) {
  State prev = state_.exchange(next);
  if (prev != next) {
    LOG_DEBUG("[conn " << connectionId_ << "] backend " << clientStateName(prev)
              << " -> " << clientStateName(next));
  }
}

std::shared_ptr<SegmentTicket>
RecognitionSessionClient::Core::enqueue(uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_)
    return nullptr;
  if (queue_.size() >= settings_.maxPendingSegments) {
    LOG_WARN("[conn " << connectionId_ << "] backend queue full ("
             << queue_.size() << "), rejecting segment " << sequence);
    return nullptr;
  }
  auto ticket = std::make_shared<SegmentTicket>(sequence);
  queue_.push_back(ticket);
  cv_.notify_all();
  return ticket;
}

size_t RecognitionSessionClient::Core::queued() {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void RecognitionSessionClient::Core::run() {
  try {
    while (true) {
      std::shared_ptr<SegmentTicket> ticket;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return cancelled_ || !queue_.empty(); });
        if (cancelled_)
          break;
        ticket = queue_.front();
        queue_.pop_front();
        current_ = ticket;
      }

      process(ticket);

      std::lock_guard<std::mutex> lock(mutex_);
      current_.reset();
    }
  } catch (const std::exception &e) {
    LOG_ERROR("[conn " << connectionId_ << "] recognition worker failed: "
              << e.what());
  }

  setState(State::IDLE);
  std::lock_guard<std::mutex> lock(exitMutex_);
  exited_ = true;
  exitCv_.notify_all();
}

void RecognitionSessionClient::Core::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  cancelled_ = true;
  for (auto &t : queue_)
    t->abandon();
  queue_.clear();
  if (current_)
    current_->abandon();
  if (currentStream_)
    currentStream_->cancel();
  cv_.notify_all();
}

bool RecognitionSessionClient::Core::waitExited(std::chrono::milliseconds grace) {
  std::unique_lock<std::mutex> lock(exitMutex_);
  return exitCv_.wait_for(lock, grace, [this] { return exited_; });
}

bool RecognitionSessionClient::Core::sleepFor(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

void RecognitionSessionClient::Core::fail(uint64_t sequence, ErrorKind kind,
                                          const std::string &detail) {
  LOG_WARN("[conn " << connectionId_ << "] segment " << sequence << " failed: "
           << errorKindName(kind) << ": " << detail);
  if (failureCb_)
    failureCb_(sequence, kind, detail);
}

std::unique_ptr<RecognitionStream>
RecognitionSessionClient::Core::connect(const StreamOptions &options,
                                        std::string &error,
                                        std::chrono::milliseconds &stalled) {
  auto delay = std::chrono::milliseconds(settings_.retryInitialDelayMs);
  const auto maxDelay = std::chrono::milliseconds(settings_.retryMaxDelayMs);
  const auto started = Clock::now();
  auto sinceStart = [&started]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                                 started);
  };

  for (int attempt = 0; attempt <= settings_.maxRetries; ++attempt) {
    if (attempt > 0) {
      LOG_INFO("[conn " << connectionId_ << "] retrying backend in "
               << delay.count() << "ms (attempt " << attempt + 1 << "/"
               << settings_.maxRetries + 1 << ")");
      if (!sleepFor(delay)) {
        stalled = sinceStart();
        return nullptr;
      }
      delay = std::min(delay * 2, maxDelay);
    }

    // Failed attempts and backoff count towards the segment's latency.
    stalled = sinceStart();
    auto stream = backend_->open(options, error);
    if (stream)
      return stream;
    LOG_WARN("[conn " << connectionId_ << "] " << backend_->name()
             << " open failed: " << error);
  }
  stalled = sinceStart();
  return nullptr;
}

void RecognitionSessionClient::Core::readLoop(RecognitionStream *stream,
                                              std::shared_ptr<Call> call,
                                              uint64_t sequence) {
  RecognitionResult result;
  try {
    while (stream->read(result)) {
      result.sequence = sequence;
      std::lock_guard<std::mutex> lock(call->mutex);
      if (!call->answered) {
        call->answered = true;
        call->cv.notify_all();
      }
      if (call->closed)
        continue;
      if (result.isFinal) {
        call->finals.push_back(result);
      } else if (resultCb_) {
        // Partials of a multi-utterance call carry the finals before them.
        std::string prefix;
        for (const auto &f : call->finals) {
          if (!f.text.empty())
            prefix += f.text + " ";
        }
        result.text = prefix + result.text;
        resultCb_(result);
      }
    }
  } catch (const std::exception &e) {
    LOG_ERROR("[conn " << connectionId_ << "] result reader failed: " << e.what());
  }

  std::lock_guard<std::mutex> lock(call->mutex);
  call->ended = true;
  call->cv.notify_all();
}

void RecognitionSessionClient::Core::watchFirstResult(
    RecognitionStream *stream, std::shared_ptr<Call> call,
    std::shared_ptr<SegmentTicket> ticket, Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(call->mutex);
  if (call->cv.wait_until(lock, deadline, [&call] {
        return call->answered || call->ended || call->closed;
      }))
    return;
  call->expired = true;
  lock.unlock();

  // Unblocks a write stuck on flow control as well as the pump waiting for audio.
  stream->cancel();
  ticket->interrupt();
}

bool RecognitionSessionClient::Core::pump(RecognitionStream &stream,
                                          SegmentTicket &ticket,
                                          bool incremental) {
  if (!incremental && !ticket.waitSealed())
    return false;

  std::shared_ptr<const std::vector<char>> chunk;
  while (true) {
    switch (ticket.next(chunk)) {
    case SegmentTicket::Next::CHUNK:
      if (!stream.write(*chunk))
        return false;
      break;
    case SegmentTicket::Next::SEALED:
      return stream.writesDone();
    case SegmentTicket::Next::ABANDONED:
    case SegmentTicket::Next::INTERRUPTED:
      return false;
    }
  }
}

void RecognitionSessionClient::Core::finishCall(RecognitionStream &stream,
                                                std::thread &reader,
                                                std::thread &watchdog,
                                                const std::shared_ptr<Call> &call) {
  bool ended;
  {
    std::lock_guard<std::mutex> lock(call->mutex);
    call->closed = true;
    ended = call->ended;
    call->cv.notify_all();
  }
  if (!ended)
    stream.cancel();
  if (watchdog.joinable())
    watchdog.join();
  if (reader.joinable())
    reader.join();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    currentStream_ = nullptr;
  }
}

RecognitionResult
RecognitionSessionClient::Core::merge(std::vector<RecognitionResult> finals) {
  RecognitionResult out;
  if (finals.empty()) {
    out.isFinal = true;
    return out;
  }

  out = std::move(finals.front());
  double confidenceSum = out.confidence;
  for (size_t i = 1; i < finals.size(); ++i) {
    auto &f = finals[i];
    if (!f.text.empty()) {
      if (!out.text.empty())
        out.text += " ";
      out.text += f.text;
    }
    out.words.insert(out.words.end(), f.words.begin(), f.words.end());
    confidenceSum += f.confidence;
  }
  out.confidence = confidenceSum / finals.size();
  out.isFinal = true;
  return out;
}

void RecognitionSessionClient::Core::process(
    const std::shared_ptr<SegmentTicket> &ticket) {
  const uint64_t seq = ticket->sequence();
  StreamOptions options;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options = options_;
  }

  setState(State::CONNECTING);
  std::string error;
  auto stalled = std::chrono::milliseconds(0);
  auto stream = connect(options, error, stalled);
  RecognitionBackend *used = backend_.get();

  if (!stream && !ticket->abandoned()) {
    setState(State::FAILED);
    if (fallback_ &&
        settings_.degradedMode == BackendSettings::DegradedMode::SYNTHETIC) {
      if (!degraded_) {
        degraded_ = true;
        LOG_WARN("[conn " << connectionId_ << "] backend unavailable, "
                 << "serving synthetic transcripts: " << error);
        if (degradedCb_)
          degradedCb_(error);
      }
      stream = fallback_->open(options, error);
      used = fallback_.get();
    }
    if (!stream) {
      fail(seq, ErrorKind::BackendUnavailable, error);
      ticket->abandon();
      sleepFor(std::chrono::milliseconds(settings_.retryInitialDelayMs));
      setState(State::IDLE);
      return;
    }
  } else if (stream && degraded_) {
    degraded_ = false;
    LOG_INFO("[conn " << connectionId_ << "] backend reachable again");
  }

  if (!stream) {
    // Abandoned while connecting.
    setState(State::IDLE);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
      stream->cancel();
    }
    currentStream_ = stream.get();
  }

  setState(State::STREAMING);
  auto call = std::make_shared<Call>();
  std::thread reader(&Core::readLoop, this, stream.get(), call, seq);
  std::thread watchdog;
  const auto timeout = std::chrono::milliseconds(settings_.requestTimeoutMs);
  if (options.enablePartials && used->partialsWhileStreaming()) {
    watchdog = std::thread(&Core::watchFirstResult, this, stream.get(), call,
                           ticket, Clock::now() + timeout);
  }

  bool sent = pump(*stream, *ticket, used->supportsIncremental());
  if (ticket->abandoned()) {
    finishCall(*stream, reader, watchdog, call);
    stream->finishError();
    setState(State::IDLE);
    return;
  }

  setState(State::CLOSING);
  std::string timeoutDetail;
  std::vector<RecognitionResult> finals;
  {
    std::unique_lock<std::mutex> lock(call->mutex);
    if (sent && !call->expired) {
      auto deadline = Clock::now() + timeout;
      // Wake up now and then so an abandoned segment does not hold the call.
      while (!call->ended && !ticket->abandoned()) {
        auto now = Clock::now();
        if (now >= deadline) {
          timeoutDetail = "no final result within " +
                          std::to_string(settings_.requestTimeoutMs) + "ms";
          break;
        }
        call->cv.wait_until(lock, std::min(deadline, now + std::chrono::milliseconds(50)));
      }
    }
    if (call->expired) {
      timeoutDetail = "no result within " +
                      std::to_string(settings_.requestTimeoutMs) +
                      "ms of opening the call";
    }
    finals = call->finals;
  }

  finishCall(*stream, reader, watchdog, call);
  std::string streamError = stream->finishError();
  if (ticket->abandoned()) {
    setState(State::IDLE);
    return;
  }

  if (!timeoutDetail.empty()) {
    fail(seq, ErrorKind::SegmentTimeout, timeoutDetail);
    setState(State::IDLE);
    return;
  }

  if (!sent || !streamError.empty()) {
    // The audio is gone once VAD has moved on, so the segment is not replayed.
    setState(State::FAILED);
    fail(seq, ErrorKind::TransportError,
         streamError.empty() ? "backend stream closed while sending audio" : streamError);
    sleepFor(std::chrono::milliseconds(settings_.retryInitialDelayMs));
    setState(State::IDLE);
    return;
  }

  RecognitionResult final = merge(std::move(finals));
  final.sequence = seq;
  final.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                      Clock::now() - ticket->sealedAt()) +
                  stalled;
  LOG_DEBUG("[conn " << connectionId_ << "] segment " << seq << " final in "
            << final.latency.count() << "ms via " << used->name());
  if (resultCb_)
    resultCb_(final);
  setState(State::IDLE);
}

RecognitionSessionClient::RecognitionSessionClient(
    std::shared_ptr<RecognitionBackend> backend,
    std::shared_ptr<RecognitionBackend> fallback,
    const BackendSettings &settings, const std::string &connectionId)
    : core_(std::make_shared<Core>(std::move(backend), std::move(fallback),
                                   settings, connectionId)) {}

RecognitionSessionClient::~RecognitionSessionClient() {
  close(std::chrono::milliseconds(0));
}

void RecognitionSessionClient::setResultCallback(ResultCallback cb) {
  core_->resultCb_ = cb;
}

void RecognitionSessionClient::setFailureCallback(FailureCallback cb) {
  core_->failureCb_ = cb;
}

void RecognitionSessionClient::setDegradedCallback(DegradedCallback cb) {
  core_->degradedCb_ = cb;
}

void RecognitionSessionClient::open(const StreamOptions &options) {
  {
    std::lock_guard<std::mutex> lock(core_->mutex_);
    core_->options_ = options;
  }

  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (started_ || cancelled_)
    return;
  started_ = true;
  auto core = core_;
  worker_ = std::thread([core]() { core->run(); });
}

std::shared_ptr<SegmentTicket> RecognitionSessionClient::beginSegment(uint64_t sequence) {
  {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!started_ || cancelled_)
      return nullptr;
  }
  return core_->enqueue(sequence);
}

std::shared_ptr<SegmentTicket> RecognitionSessionClient::send(const AudioSegment &segment) {
  auto ticket = beginSegment(segment.sequence);
  if (!ticket)
    return nullptr;
  for (const auto &frame : segment.frames)
    ticket->append(frame);
  ticket->seal();
  return ticket;
}

size_t RecognitionSessionClient::queuedSegments() const { return core_->queued(); }

RecognitionSessionClient::State RecognitionSessionClient::state() const {
  return core_->state();
}

void RecognitionSessionClient::cancel() {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  cancelLocked();
}

void RecognitionSessionClient::cancelLocked() {
  if (cancelled_)
    return;
  cancelled_ = true;
  core_->cancel();
}

bool RecognitionSessionClient::stopped() const {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (!started_ || released_)
    return true;
  return core_->waitExited(std::chrono::milliseconds(0));
}

bool RecognitionSessionClient::close(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  cancelLocked();
  if (!started_ || released_)
    return true;
  released_ = true;

  if (core_->waitExited(grace)) {
    worker_.join();
    return true;
  }

  LOG_ERROR("Recognition worker ignored cancellation for "
            << grace.count() << "ms, leaving it behind");
  worker_.detach();
  return false;
}
