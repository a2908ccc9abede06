#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "kv_types.h"

namespace google {
namespace protobuf {
namespace io {
class ZeroCopyInputStream;
class ZeroCopyOutputStream;
}  // namespace io
}  // namespace protobuf
}  // namespace google

namespace kvproto {
class Transaction;
class Response;
}  // namespace kvproto

/**
 * Wire formats shared with the replicas.
 *
 * ABD mode exchanges self-describing protobuf messages (kvproto.proto), each
 * prefixed with its varint length. Fast-path mode exchanges fixed-layout
 * little-endian records; every Propose is preceded by a one-byte message tag.
 */

namespace Replibench {
namespace wire {

// ============================================================================
// ABD: Transaction / Response
// ============================================================================

struct Transaction {
    std::vector<Command> commands;
    bool read_only = false;
    int64_t ts = 0;
    int64_t tid = 0;
};

struct Response {
    int64_t tid = 0;
    int64_t ts = 0;
    int64_t size = 0;
    std::vector<Value> vals;
    uint8_t is_fast = 0;
    uint8_t is_water = 0;  // opaque, passed through unmodified
};

void ToProto(const Transaction& txn, kvproto::Transaction* out);
Transaction FromProto(const kvproto::Transaction& msg);
void ToProto(const Response& resp, kvproto::Response* out);
Response FromProto(const kvproto::Response& msg);

/// Writes one length-delimited Transaction. Returns false on a write error.
bool WriteTransaction(const Transaction& txn, google::protobuf::io::ZeroCopyOutputStream* out);
bool WriteResponse(const Response& resp, google::protobuf::io::ZeroCopyOutputStream* out);

enum class ReadStatus {
    kOk,
    kMalformed,  // bytes were consumed but did not form a message
    kClosed,     // clean end of stream
};

ReadStatus ReadTransaction(google::protobuf::io::ZeroCopyInputStream* in, Transaction* txn);
ReadStatus ReadResponse(google::protobuf::io::ZeroCopyInputStream* in, Response* resp);

// ============================================================================
// Fast path: Propose / ProposeReply
// ============================================================================

static constexpr uint8_t PROPOSE = 0;

struct ProposeMessage {
    int32_t command_id = 0;
    Command command;
    int64_t timestamp = 0;
};

struct ProposeReply {
    uint8_t ok = 0;
    int32_t command_id = 0;
    Value value = 0;
    int64_t timestamp = 0;
};

// command_id(4) + op(1) + key(8) + value(8) + timestamp(8)
static constexpr size_t kProposeSize = 29;
// ok(1) + command_id(4) + value(8) + timestamp(8)
static constexpr size_t kProposeReplySize = 21;

/// Writes the PROPOSE tag followed by the record.
bool WritePropose(const ProposeMessage& msg, google::protobuf::io::ZeroCopyOutputStream* out);
/// Reads a tagged Propose (the replica side of the exchange, used by tests).
ReadStatus ReadPropose(google::protobuf::io::ZeroCopyInputStream* in, ProposeMessage* msg);

bool WriteProposeReply(const ProposeReply& reply, google::protobuf::io::ZeroCopyOutputStream* out);
ReadStatus ReadProposeReply(google::protobuf::io::ZeroCopyInputStream* in, ProposeReply* reply);

}  // namespace wire
}  // namespace Replibench
