/**
 * RFC 5444 Decoder: N-API addon.
 * Exposes decodePacket(buffer) plus start(config, onPacket), stop(),
 * isRunning() and getLastError() for capture to TypeScript.
 */

#include <napi.h>
#include <memory>
#include <string>
#include <vector>

#include "capture.hpp"
#include "frame.hpp"
#include "packet.hpp"

namespace {

rfc5444::CaptureEngine* g_engine = nullptr;
Napi::ThreadSafeFunction* g_packet_tsf = nullptr;

// Helpers to read config from N-API object
bool get_string(Napi::Env env, const Napi::Object& obj, const char* key, std::string* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsString()) return false;
  *out = v.As<Napi::String>().Utf8Value();
  return true;
}

bool get_number(Napi::Env env, const Napi::Object& obj, const char* key, double* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsNumber()) return false;
  *out = v.As<Napi::Number>().DoubleValue();
  return true;
}

bool get_bool(Napi::Env env, const Napi::Object& obj, const char* key, bool* out) {
  if (!obj.Has(key)) return false;
  Napi::Value v = obj.Get(key);
  if (!v.IsBoolean()) return false;
  *out = v.As<Napi::Boolean>().Value();
  return true;
}

/** config.ports is optional; when present it must be a non-empty array of numbers. */
bool get_ports(Napi::Env env, const Napi::Object& obj, std::vector<uint16_t>* out) {
  if (!obj.Has("ports")) return true;
  if (!obj.Get("ports").IsArray()) return false;
  Napi::Array arr = obj.Get("ports").As<Napi::Array>();
  out->clear();
  for (size_t i = 0; i < arr.Length(); i++) {
    Napi::Value v = arr[i];
    if (!v.IsNumber()) return false;
    out->push_back(static_cast<uint16_t>(v.As<Napi::Number>().Uint32Value()));
  }
  return !out->empty();
}

void throw_decode_error(Napi::Env env, rfc5444::DecodeError err) {
  Napi::Error e = Napi::Error::New(env, std::string("RFC 5444 decode failed: ") + rfc5444::to_string(err));
  e.Set("code", Napi::String::New(env, rfc5444::to_string(err)));
  e.Set("errno", Napi::Number::New(env, rfc5444::error_code(err)));
  e.ThrowAsJavaScriptException();
}

Napi::Value span_to_buffer(Napi::Env env, rfc5444::ByteSpan span) {
  return Napi::Buffer<uint8_t>::Copy(env, span.data, span.size);
}

Napi::Object endpoint_to_js(Napi::Env env, const std::string& ip, uint16_t port) {
  Napi::Object o = Napi::Object::New(env);
  o.Set("ip", ip);
  o.Set("port", static_cast<uint32_t>(port));
  return o;
}

// The to_js walkers below only run on packets validate_packet() accepted,
// so every iterator they drive ends without an error.

Napi::Array tlv_block_to_js(Napi::Env env, const rfc5444::TlvBlockView& block) {
  Napi::Array arr = Napi::Array::New(env);
  rfc5444::TlvIterator it = block.iterator();
  rfc5444::Tlv tlv;
  uint32_t n = 0;
  while (it.next(tlv)) {
    Napi::Object o = Napi::Object::New(env);
    o.Set("type", static_cast<uint32_t>(tlv.type));
    if (tlv.has_type_ext) o.Set("typeExt", static_cast<uint32_t>(tlv.type_ext));
    if (tlv.in_address_block) {
      o.Set("indexStart", static_cast<uint32_t>(tlv.index_start));
      o.Set("indexStop", static_cast<uint32_t>(tlv.index_stop));
    }
    if (tlv.has_value) o.Set("value", span_to_buffer(env, tlv.value));
    if (tlv.multivalue) o.Set("multivalue", true);
    arr.Set(n++, o);
  }
  return arr;
}

Napi::Object address_block_to_js(Napi::Env env, const rfc5444::AddressBlock& block) {
  Napi::Object o = Napi::Object::New(env);
  Napi::Array addrs = Napi::Array::New(env);
  uint8_t addr[rfc5444::kMaxAddressLength];
  for (size_t i = 0; i < block.num_addr; i++) {
    uint8_t prefix = 0;
    if (!block.address(i, addr, sizeof(addr)) || !block.prefix_length(i, prefix)) break;
    Napi::Object a = Napi::Object::New(env);
    a.Set("address", rfc5444::format_address(addr, block.addr_length));
    a.Set("prefixLength", static_cast<uint32_t>(prefix));
    addrs.Set(static_cast<uint32_t>(i), a);
  }
  o.Set("addresses", addrs);
  o.Set("headLength", static_cast<uint32_t>(block.head.size));
  o.Set("tailLength", static_cast<uint32_t>(block.tail_length));
  o.Set("zeroTail", block.zero_tail);
  o.Set("tlvs", tlv_block_to_js(env, block.tlv_block));
  return o;
}

Napi::Object message_to_js(Napi::Env env, const rfc5444::Message& msg) {
  const rfc5444::MessageHeader& h = msg.header;
  Napi::Object o = Napi::Object::New(env);
  o.Set("type", static_cast<uint32_t>(h.type));
  o.Set("addrLength", static_cast<uint32_t>(h.addr_length));
  o.Set("size", static_cast<uint32_t>(h.size));
  if (h.has_orig_addr) o.Set("origAddr", rfc5444::format_address(h.orig_addr.data, h.orig_addr.size));
  if (h.has_hop_limit) o.Set("hopLimit", static_cast<uint32_t>(h.hop_limit));
  if (h.has_hop_count) o.Set("hopCount", static_cast<uint32_t>(h.hop_count));
  if (h.has_seq_num) o.Set("seqNum", static_cast<uint32_t>(h.seq_num));
  o.Set("tlvs", tlv_block_to_js(env, msg.tlv_block));
  Napi::Array blocks = Napi::Array::New(env);
  rfc5444::AddressBlockIterator it = msg.address_block_iterator();
  rfc5444::AddressBlock block;
  uint32_t n = 0;
  while (it.next(block)) blocks.Set(n++, address_block_to_js(env, block));
  o.Set("addressBlocks", blocks);
  return o;
}

Napi::Object packet_to_js(Napi::Env env, const rfc5444::Packet& pkt) {
  Napi::Object o = Napi::Object::New(env);
  o.Set("version", static_cast<uint32_t>(pkt.header.version));
  if (pkt.header.has_seq_num) o.Set("seqNum", static_cast<uint32_t>(pkt.header.seq_num));
  o.Set("tlvs", tlv_block_to_js(env, pkt.tlv_block));
  Napi::Array msgs = Napi::Array::New(env);
  rfc5444::MessageIterator it = pkt.message_iterator();
  rfc5444::Message msg;
  uint32_t n = 0;
  while (it.next(msg)) msgs.Set(n++, message_to_js(env, msg));
  o.Set("messages", msgs);
  return o;
}

/** Datagram copied off the capture thread for delivery on the JS thread. */
struct DatagramPayload {
  rfc5444::FourTuple tuple;
  uint64_t timestamp_us{0};
  rfc5444::DecodeError status{rfc5444::DecodeError::kNone};
  std::vector<uint8_t> bytes;
};

void packet_tsf_callback(Napi::Env env, Napi::Function js_callback, DatagramPayload* data) {
  std::unique_ptr<DatagramPayload> payload(data);
  if (!payload || env == nullptr || js_callback.IsEmpty()) return;
  Napi::Object msg = Napi::Object::New(env);
  msg.Set("source", endpoint_to_js(env, payload->tuple.src_ip, payload->tuple.src_port));
  msg.Set("destination", endpoint_to_js(env, payload->tuple.dst_ip, payload->tuple.dst_port));
  msg.Set("timestamp", Napi::Number::New(env, static_cast<double>(payload->timestamp_us) / 1000.0));
  msg.Set("length", static_cast<uint32_t>(payload->bytes.size()));
  if (payload->status == rfc5444::DecodeError::kNone) {
    rfc5444::Packet pkt;
    rfc5444::DecodeError err = rfc5444::decode_packet(payload->bytes.data(), payload->bytes.size(), pkt);
    if (err == rfc5444::DecodeError::kNone) {
      msg.Set("packet", packet_to_js(env, pkt));
    } else {
      msg.Set("error", rfc5444::to_string(err));
    }
  } else {
    msg.Set("error", rfc5444::to_string(payload->status));
  }
  js_callback.Call({msg});
}

void release_tsf() {
  if (g_packet_tsf != nullptr) {
    g_packet_tsf->Release();
    delete g_packet_tsf;
    g_packet_tsf = nullptr;
  }
}

}  // namespace

namespace addon {

Napi::Value DecodePacket(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  if (info.Length() < 1 || !info[0].IsBuffer()) {
    Napi::TypeError::New(env, "decodePacket(buffer) requires a Buffer").ThrowAsJavaScriptException();
    return env.Null();
  }
  Napi::Buffer<uint8_t> buf = info[0].As<Napi::Buffer<uint8_t>>();
  rfc5444::DecodeError err = rfc5444::validate_packet(buf.Data(), buf.Length());
  rfc5444::Packet pkt;
  if (err == rfc5444::DecodeError::kNone) err = rfc5444::decode_packet(buf.Data(), buf.Length(), pkt);
  if (err != rfc5444::DecodeError::kNone) {
    throw_decode_error(env, err);
    return env.Null();
  }
  return packet_to_js(env, pkt);
}

Napi::Value Start(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  if (info.Length() < 1 || !info[0].IsObject()) {
    Napi::TypeError::New(env, "Start(config) requires a config object").ThrowAsJavaScriptException();
    return env.Null();
  }
  Napi::Object config = info[0].As<Napi::Object>();

  rfc5444::CaptureConfig cfg;
  get_string(env, config, "interface", &cfg.interface_name);
  get_string(env, config, "file", &cfg.capture_file);
  if (!get_ports(env, config, &cfg.ports)) {
    Napi::TypeError::New(env, "config.ports must be a non-empty array of numbers").ThrowAsJavaScriptException();
    return env.Null();
  }
  double num = 0;
  if (get_number(env, config, "snaplen", &num)) cfg.snaplen = static_cast<int>(num);
  if (get_number(env, config, "readTimeoutMs", &num)) cfg.read_timeout_ms = static_cast<int>(num);
  get_bool(env, config, "promiscuous", &cfg.promiscuous);

  if (g_engine == nullptr) g_engine = new rfc5444::CaptureEngine();
  if (g_engine->is_running()) {
    Napi::Error::New(env, "capture already running").ThrowAsJavaScriptException();
    return env.Null();
  }
  // a finished replay still holds its handle until joined
  g_engine->wait();

  release_tsf();
  if (info.Length() >= 2 && info[1].IsFunction()) {
    g_packet_tsf = new Napi::ThreadSafeFunction(
        Napi::ThreadSafeFunction::New(env, info[1].As<Napi::Function>(), "onPacket", 0, 1));
  }

  rfc5444::PacketCallback on_packet = [](const rfc5444::CapturedPacket& pkt) {
    if (g_packet_tsf == nullptr) return;
    DatagramPayload* payload = new DatagramPayload;
    payload->tuple = pkt.tuple;
    payload->timestamp_us = pkt.timestamp_us;
    payload->status = pkt.status;
    payload->bytes.assign(pkt.payload, pkt.payload + pkt.payload_len);
    if (g_packet_tsf->BlockingCall(payload, packet_tsf_callback) != napi_ok) delete payload;
  };
  bool ok = g_engine->start(cfg, on_packet, [](const std::string&, const std::string&) {});
  if (!ok) {
    Napi::Error::New(env, g_engine->last_error_message()).ThrowAsJavaScriptException();
    return env.Null();
  }
  return Napi::Boolean::New(env, true);
}

Napi::Value Stop(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  Napi::Object result = Napi::Object::New(env);
  if (g_engine != nullptr) {
    g_engine->stop();
    result.Set("datagrams", Napi::Number::New(env, static_cast<double>(g_engine->datagrams())));
    result.Set("decodeFailures", Napi::Number::New(env, static_cast<double>(g_engine->decode_failures())));
    if (g_engine->has_last_stats()) {
      result.Set("packetsReceived", Napi::Number::New(env, static_cast<double>(g_engine->last_ps_recv())));
      result.Set("packetsDropped", Napi::Number::New(env, static_cast<double>(g_engine->last_ps_drop())));
      result.Set("packetsIfDropped", Napi::Number::New(env, static_cast<double>(g_engine->last_ps_ifdrop())));
    }
  }
  release_tsf();
  return result;
}

Napi::Value IsRunning(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  return Napi::Boolean::New(env, g_engine != nullptr && g_engine->is_running());
}

Napi::Value GetLastError(const Napi::CallbackInfo& info) {
  Napi::Env env = info.Env();
  Napi::Object o = Napi::Object::New(env);
  if (g_engine != nullptr) {
    o.Set("code", g_engine->last_error_code());
    o.Set("message", g_engine->last_error_message());
  }
  return o;
}

}  // namespace addon

Napi::Object Init(Napi::Env env, Napi::Object exports) {
  exports.Set("decodePacket", Napi::Function::New(env, addon::DecodePacket));
  exports.Set("start", Napi::Function::New(env, addon::Start));
  exports.Set("stop", Napi::Function::New(env, addon::Stop));
  exports.Set("isRunning", Napi::Function::New(env, addon::IsRunning));
  exports.Set("getLastError", Napi::Function::New(env, addon::GetLastError));
  return exports;
}

NODE_API_MODULE(rfc5444_native, Init)
