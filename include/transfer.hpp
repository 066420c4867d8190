#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "protocol.hpp"

namespace webrepl {

enum class TransferState : uint8_t {
    Idle,
    PutAwaitInitialAck,
    PutAwaitFinalAck,
    GetAwaitInitialAck,
    GetStreaming,
    GetAwaitFinalAck,
    VersionAwaitResponse
};

const char* state_str(TransferState s);

enum class TransferKind : uint8_t { Put, Get, Version };

struct TransferSession {
    TransferState state{TransferState::Idle};
    TransferKind kind{TransferKind::Put};
    std::string filename;
    std::vector<uint8_t> buffer; // outbound file for PUT, accumulated for GET
    size_t offset{0};            // PUT chunk cursor
};

// Single report per transfer attempt.
struct Completion {
    TransferKind kind{TransferKind::Put};
    std::string filename;
    bool ok{false};
    Error error{Error::None};
    uint16_t remote_status{0};
    size_t bytes{0};
    std::vector<uint8_t> data; // GET file contents or raw version payload
};

// Effects of one engine call. Outbound messages must be sent in order.
struct Step {
    bool consumed{false};
    std::vector<std::vector<uint8_t>> outbound;
    std::optional<Completion> done;
};

class TransferEngine {
public:
    explicit TransferEngine(FilenamePolicy policy = FilenamePolicy::Strict)
        : policy_(policy) {}

    Error start_put(const std::string& filename, std::vector<uint8_t> data, Step& out);
    Error start_get(const std::string& filename, Step& out);
    Error start_version_query(Step& out);

    Step on_binary(const uint8_t* data, size_t len);
    Step on_binary(const std::vector<uint8_t>& msg) { return on_binary(msg.data(), msg.size()); }

    // Abandons the active transfer locally. The device may still be waiting.
    void reset();

    bool idle() const { return session_.state == TransferState::Idle; }
    TransferState state() const { return session_.state; }
    const TransferSession& session() const { return session_; }

private:
    void on_put_initial_ack(const uint8_t* data, size_t len, Step& st);
    void on_put_final_ack(const uint8_t* data, size_t len, Step& st);
    void on_get_initial_ack(const uint8_t* data, size_t len, Step& st);
    void on_get_chunk(const uint8_t* data, size_t len, Step& st);
    void on_get_final_ack(const uint8_t* data, size_t len, Step& st);
    void on_version(const uint8_t* data, size_t len, Step& st);

    void finish(Step& st, bool ok, Error err, uint16_t status = 0);
    void begin(TransferState s, TransferKind k, const std::string& filename);

    FilenamePolicy policy_;
    TransferSession session_;
};

} // namespace webrepl
