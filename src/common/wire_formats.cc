#include "wire_formats.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <kvproto.pb.h>

namespace Replibench {
namespace wire {

using google::protobuf::io::CodedInputStream;
using google::protobuf::io::CodedOutputStream;
using google::protobuf::io::ZeroCopyInputStream;
using google::protobuf::io::ZeroCopyOutputStream;

namespace {

kvproto::Operation ToProtoOp(Operation op) {
    switch (op) {
        case GET: return kvproto::GET;
        case PUT: return kvproto::PUT;
        default: return kvproto::NONE;
    }
}

Operation FromProtoOp(kvproto::Operation op) {
    switch (op) {
        case kvproto::GET: return GET;
        case kvproto::PUT: return PUT;
        default: return NONE;
    }
}

Operation FromWireOp(uint8_t op) {
    return (op == GET || op == PUT) ? static_cast<Operation>(op) : NONE;
}

template <typename Msg>
ReadStatus ReadDelimited(ZeroCopyInputStream* in, Msg* msg) {
    bool clean_eof = false;
    if (google::protobuf::util::ParseDelimitedFromZeroCopyStream(msg, in, &clean_eof)) {
        return ReadStatus::kOk;
    }
    return clean_eof ? ReadStatus::kClosed : ReadStatus::kMalformed;
}

}  // namespace

void ToProto(const Transaction& txn, kvproto::Transaction* out) {
    out->Clear();
    for (const Command& cmd : txn.commands) {
        kvproto::Command* c = out->add_commands();
        c->set_op(ToProtoOp(cmd.op));
        c->set_key(cmd.key);
        c->set_value(cmd.value);
    }
    out->set_read_only(txn.read_only ? 1 : 0);
    out->set_ts(txn.ts);
    out->set_tid(txn.tid);
}

Transaction FromProto(const kvproto::Transaction& msg) {
    Transaction txn;
    txn.commands.reserve(msg.commands_size());
    for (const kvproto::Command& c : msg.commands()) {
        txn.commands.push_back(Command{FromProtoOp(c.op()), c.key(), c.value()});
    }
    txn.read_only = msg.read_only() != 0;
    txn.ts = msg.ts();
    txn.tid = msg.tid();
    return txn;
}

void ToProto(const Response& resp, kvproto::Response* out) {
    out->Clear();
    out->set_tid(resp.tid);
    out->set_ts(resp.ts);
    out->set_size(resp.size);
    for (Value v : resp.vals) {
        out->add_vals(v);
    }
    out->set_is_fast(resp.is_fast);
    out->set_is_water(resp.is_water);
}

Response FromProto(const kvproto::Response& msg) {
    Response resp;
    resp.tid = msg.tid();
    resp.ts = msg.ts();
    resp.size = msg.size();
    resp.vals.assign(msg.vals().begin(), msg.vals().end());
    resp.is_fast = static_cast<uint8_t>(msg.is_fast());
    resp.is_water = static_cast<uint8_t>(msg.is_water());
    return resp;
}

bool WriteTransaction(const Transaction& txn, ZeroCopyOutputStream* out) {
    kvproto::Transaction msg;
    ToProto(txn, &msg);
    return google::protobuf::util::SerializeDelimitedToZeroCopyStream(msg, out);
}

bool WriteResponse(const Response& resp, ZeroCopyOutputStream* out) {
    kvproto::Response msg;
    ToProto(resp, &msg);
    return google::protobuf::util::SerializeDelimitedToZeroCopyStream(msg, out);
}

ReadStatus ReadTransaction(ZeroCopyInputStream* in, Transaction* txn) {
    kvproto::Transaction msg;
    ReadStatus status = ReadDelimited(in, &msg);
    if (status == ReadStatus::kOk) {
        *txn = FromProto(msg);
    }
    return status;
}

ReadStatus ReadResponse(ZeroCopyInputStream* in, Response* resp) {
    kvproto::Response msg;
    ReadStatus status = ReadDelimited(in, &msg);
    if (status == ReadStatus::kOk) {
        *resp = FromProto(msg);
    }
    return status;
}

bool WritePropose(const ProposeMessage& msg, ZeroCopyOutputStream* out) {
    CodedOutputStream coded(out);
    const uint8_t tag = PROPOSE;
    const uint8_t op = static_cast<uint8_t>(msg.command.op);
    coded.WriteRaw(&tag, 1);
    coded.WriteLittleEndian32(static_cast<uint32_t>(msg.command_id));
    coded.WriteRaw(&op, 1);
    coded.WriteLittleEndian64(static_cast<uint64_t>(msg.command.key));
    coded.WriteLittleEndian64(static_cast<uint64_t>(msg.command.value));
    coded.WriteLittleEndian64(static_cast<uint64_t>(msg.timestamp));
    return !coded.HadError();
}

ReadStatus ReadPropose(ZeroCopyInputStream* in, ProposeMessage* msg) {
    CodedInputStream coded(in);
    uint8_t tag = 0;
    if (!coded.ReadRaw(&tag, 1)) {
        return ReadStatus::kClosed;
    }
    uint32_t command_id = 0;
    uint8_t op = 0;
    uint64_t key = 0, value = 0, ts = 0;
    if (!coded.ReadLittleEndian32(&command_id) || !coded.ReadRaw(&op, 1) ||
        !coded.ReadLittleEndian64(&key) || !coded.ReadLittleEndian64(&value) ||
        !coded.ReadLittleEndian64(&ts)) {
        return ReadStatus::kClosed;
    }
    if (tag != PROPOSE) {
        return ReadStatus::kMalformed;
    }
    msg->command_id = static_cast<int32_t>(command_id);
    msg->command = Command{FromWireOp(op), static_cast<Key>(key), static_cast<Value>(value)};
    msg->timestamp = static_cast<int64_t>(ts);
    return ReadStatus::kOk;
}

bool WriteProposeReply(const ProposeReply& reply, ZeroCopyOutputStream* out) {
    CodedOutputStream coded(out);
    coded.WriteRaw(&reply.ok, 1);
    coded.WriteLittleEndian32(static_cast<uint32_t>(reply.command_id));
    coded.WriteLittleEndian64(static_cast<uint64_t>(reply.value));
    coded.WriteLittleEndian64(static_cast<uint64_t>(reply.timestamp));
    return !coded.HadError();
}

ReadStatus ReadProposeReply(ZeroCopyInputStream* in, ProposeReply* reply) {
    CodedInputStream coded(in);
    uint8_t ok = 0;
    uint32_t command_id = 0;
    uint64_t value = 0, ts = 0;
    if (!coded.ReadRaw(&ok, 1)) {
        return ReadStatus::kClosed;
    }
    if (!coded.ReadLittleEndian32(&command_id) || !coded.ReadLittleEndian64(&value) ||
        !coded.ReadLittleEndian64(&ts)) {
        // A truncated record: the stream ended in the middle of a reply.
        return ReadStatus::kMalformed;
    }
    reply->ok = ok;
    reply->command_id = static_cast<int32_t>(command_id);
    reply->value = static_cast<Value>(value);
    reply->timestamp = static_cast<int64_t>(ts);
    return ReadStatus::kOk;
}

}  // namespace wire
}  // namespace Replibench
