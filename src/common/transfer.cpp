#include "transfer.hpp"
#include "logging.hpp"
#include <algorithm>

namespace webrepl {

static const char *kTag = "transfer";

const char *state_str(TransferState s) {
  switch (s) {
  case TransferState::Idle:
    return "idle";
  case TransferState::PutAwaitInitialAck:
    return "put/await-initial-ack";
  case TransferState::PutAwaitFinalAck:
    return "put/await-final-ack";
  case TransferState::GetAwaitInitialAck:
    return "get/await-initial-ack";
  case TransferState::GetStreaming:
    return "get/streaming";
  case TransferState::GetAwaitFinalAck:
    return "get/await-final-ack";
  default:
    return "version/await-response";
  }
}

static const char *kind_str(TransferKind k) {
  switch (k) {
  case TransferKind::Put:
    return "put";
  case TransferKind::Get:
    return "get";
  default:
    return "version";
  }
}

void TransferEngine::begin(TransferState s, TransferKind k,
                           const std::string &filename) {
  session_.state = s;
  session_.kind = k;
  session_.filename = filename;
  session_.offset = 0;
}

Error TransferEngine::start_put(const std::string &filename,
                                std::vector<uint8_t> data, Step &out) {
  if (!idle())
    return Error::Busy;
  std::vector<uint8_t> rec;
  Error err;
  if (!encode_put_request(filename, data.size(), rec, err, policy_))
    return err;
  begin(TransferState::PutAwaitInitialAck, TransferKind::Put, filename);
  session_.buffer = std::move(data);
  Logger::instance().log(LogLevel::INFO, kTag, "Sending %s, %zu bytes",
                         filename.c_str(), session_.buffer.size());
  out.outbound.push_back(std::move(rec));
  return Error::None;
}

Error TransferEngine::start_get(const std::string &filename, Step &out) {
  if (!idle())
    return Error::Busy;
  std::vector<uint8_t> rec;
  Error err;
  if (!encode_get_request(filename, rec, err, policy_))
    return err;
  begin(TransferState::GetAwaitInitialAck, TransferKind::Get, filename);
  session_.buffer.clear();
  Logger::instance().log(LogLevel::INFO, kTag, "Getting %s", filename.c_str());
  out.outbound.push_back(std::move(rec));
  return Error::None;
}

Error TransferEngine::start_version_query(Step &out) {
  if (!idle())
    return Error::Busy;
  begin(TransferState::VersionAwaitResponse, TransferKind::Version,
        std::string());
  session_.buffer.clear();
  out.outbound.push_back(encode_version_request());
  return Error::None;
}

void TransferEngine::reset() {
  if (!idle())
    Logger::instance().log(LogLevel::WARN, kTag, "abandoning %s of '%s' in state %s",
                           kind_str(session_.kind), session_.filename.c_str(),
                           state_str(session_.state));
  session_ = TransferSession{};
}

Step TransferEngine::on_binary(const uint8_t *data, size_t len) {
  Step st;
  switch (session_.state) {
  case TransferState::Idle:
    // console traffic, not ours
    return st;
  case TransferState::PutAwaitInitialAck:
    on_put_initial_ack(data, len, st);
    break;
  case TransferState::PutAwaitFinalAck:
    on_put_final_ack(data, len, st);
    break;
  case TransferState::GetAwaitInitialAck:
    on_get_initial_ack(data, len, st);
    break;
  case TransferState::GetStreaming:
    on_get_chunk(data, len, st);
    break;
  case TransferState::GetAwaitFinalAck:
    on_get_final_ack(data, len, st);
    break;
  case TransferState::VersionAwaitResponse:
    on_version(data, len, st);
    break;
  }
  st.consumed = true;
  return st;
}

void TransferEngine::on_put_initial_ack(const uint8_t *data, size_t len,
                                        Step &st) {
  uint16_t status = 0;
  if (!decode_response(data, len, status))
    return finish(st, false, Error::InvalidFrame);
  if (status != 0)
    return finish(st, false, Error::RemoteRejected, status);

  const auto &buf = session_.buffer;
  while (session_.offset < buf.size()) {
    size_t n = std::min(kPutChunkSize, buf.size() - session_.offset);
    st.outbound.emplace_back(buf.begin() + session_.offset,
                             buf.begin() + session_.offset + n);
    session_.offset += n;
  }
  session_.state = TransferState::PutAwaitFinalAck;
}

void TransferEngine::on_put_final_ack(const uint8_t *data, size_t len,
                                      Step &st) {
  uint16_t status = 0;
  if (!decode_response(data, len, status))
    return finish(st, false, Error::InvalidFrame);
  if (status != 0)
    return finish(st, false, Error::RemoteRejected, status);
  finish(st, true, Error::None);
}

void TransferEngine::on_get_initial_ack(const uint8_t *data, size_t len,
                                        Step &st) {
  uint16_t status = 0;
  if (!decode_response(data, len, status))
    return finish(st, false, Error::InvalidFrame);
  if (status != 0)
    return finish(st, false, Error::RemoteRejected, status);
  session_.state = TransferState::GetStreaming;
  st.outbound.push_back({kAckByte});
}

void TransferEngine::on_get_chunk(const uint8_t *data, size_t len, Step &st) {
  uint16_t sz = 0;
  if (!decode_chunk_header(data, len, sz)) {
    session_.buffer.clear();
    return finish(st, false, Error::InvalidFrame);
  }
  // one transport message must carry exactly one chunk
  if (len != kChunkHeaderSize + sz) {
    Logger::instance().log(LogLevel::WARN, kTag,
                           "chunk declares %u bytes but message has %zu",
                           (unsigned)sz, len - kChunkHeaderSize);
    session_.buffer.clear();
    return finish(st, false, Error::ChunkLengthMismatch);
  }
  if (sz == 0) {
    session_.state = TransferState::GetAwaitFinalAck;
    return;
  }
  session_.buffer.insert(session_.buffer.end(), data + kChunkHeaderSize,
                         data + len);
  Logger::instance().log(LogLevel::DEBUG, kTag, "Getting %s, %zu bytes",
                         session_.filename.c_str(), session_.buffer.size());
  st.outbound.push_back({kAckByte});
}

void TransferEngine::on_get_final_ack(const uint8_t *data, size_t len,
                                      Step &st) {
  uint16_t status = 0;
  if (!decode_response(data, len, status))
    return finish(st, false, Error::InvalidFrame);
  if (status != 0)
    return finish(st, false, Error::RemoteRejected, status);
  finish(st, true, Error::None);
}

void TransferEngine::on_version(const uint8_t *data, size_t len, Step &st) {
  session_.buffer.assign(data, data + len);
  finish(st, true, Error::None);
}

void TransferEngine::finish(Step &st, bool ok, Error err, uint16_t status) {
  Completion c;
  c.kind = session_.kind;
  c.filename = session_.filename;
  c.ok = ok;
  c.error = err;
  c.remote_status = status;
  c.bytes = session_.buffer.size();
  if (ok && session_.kind != TransferKind::Put)
    c.data = std::move(session_.buffer);

  if (ok) {
    Logger::instance().log(LogLevel::INFO, kTag, "%s %s done, %zu bytes",
                           kind_str(c.kind), c.filename.c_str(), c.bytes);
  } else {
    c.bytes = 0;
    Logger::instance().log(LogLevel::ERROR, kTag, "%s %s failed in state %s: %s",
                           kind_str(c.kind), c.filename.c_str(),
                           state_str(session_.state), error_str(err));
  }
  session_ = TransferSession{};
  st.done = std::move(c);
}

} // namespace webrepl
