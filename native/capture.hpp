/**
 * RFC 5444 Decoder: capture layer.
 * libpcap live capture or capture-file replay, BPF filter from ports,
 * packet loop, frame decode, RFC 5444 decode, callback.
 */

#ifndef RFC5444_CAPTURE_HPP
#define RFC5444_CAPTURE_HPP

#include "error.hpp"
#include "frame.hpp"
#include "packet.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct pcap;
struct bpf_program;

namespace rfc5444 {

/** Capture settings; filled from the JS config object by the addon. */
struct CaptureConfig {
  std::string interface_name;               // live capture; "any" when empty
  std::string capture_file;                 // replay this file instead when set
  std::vector<uint16_t> ports{kManetPort};
  int snaplen{65535};
  bool promiscuous{true};
  int read_timeout_ms{1000};
};

/**
 * One RFC 5444 datagram seen on the wire.
 * payload and packet borrow the capture buffer and are only valid during
 * the callback; copy what must outlive it.
 */
struct CapturedPacket {
  FourTuple tuple;
  uint64_t timestamp_us{0};
  const uint8_t* payload{nullptr};
  size_t payload_len{0};
  DecodeError status{DecodeError::kNone};  // result of validate_packet
  Packet packet;                           // header view, valid when status is kNone
};

/** Callback for each datagram. Called from the capture thread. */
using PacketCallback = std::function<void(const CapturedPacket&)>;

/** Optional error callback (fatal). */
using ErrorCallback = std::function<void(const std::string& code, const std::string& message)>;

/**
 * Capture engine: open pcap, apply BPF, run loop, decode and invoke callback.
 * Thread: start() begins a capture thread; stop() signals stop and joins,
 * wait() joins without interrupting (a replay ends at end of file).
 */
class CaptureEngine {
 public:
  CaptureEngine();
  ~CaptureEngine();

  /** Build BPF from ports and open the interface or file. Returns false on error. */
  bool start(const CaptureConfig& config,
             PacketCallback on_packet,
             ErrorCallback on_error);

  /** Break the loop, close handle. Blocks until done. */
  void stop();

  /** Wait for the loop to finish on its own, then close handle. */
  void wait();

  /** Whether the capture loop is currently running. */
  bool is_running() const { return running_; }

  /** Called from pcap callback; decodes and invokes on_packet. Do not call from TS. */
  void dispatch_frame(const uint8_t* data, size_t caplen, uint64_t timestamp_us);

  /** Last fatal error if start failed or the loop aborted. */
  std::string last_error_code() const;
  std::string last_error_message() const;

  /** Datagrams delivered, and how many of them failed to decode. */
  uint64_t datagrams() const { return datagrams_; }
  uint64_t decode_failures() const { return decode_failures_; }

  /** Capture stats (pcap_stats) from the last stop()/wait(); live captures only. */
  unsigned int last_ps_recv() const { return last_ps_recv_; }
  unsigned int last_ps_drop() const { return last_ps_drop_; }
  unsigned int last_ps_ifdrop() const { return last_ps_ifdrop_; }
  bool has_last_stats() const { return last_stats_valid_; }

 private:
  bool open_handle(std::string* source);
  bool apply_filter(const std::string& filter);
  void log_startup(const std::string& source, const std::string& filter) const;
  void run_loop();
  void close_handle(bool record_stats);
  std::string build_bpf_filter(const std::vector<uint16_t>& ports) const;
  void report_error(const std::string& code, const std::string& message);
  void log_decode_error(const CapturedPacket& pkt) const;

  pcap* pcap_handle_{nullptr};
  bpf_program* bpf_program_{nullptr};
  int link_type_{kLinkEthernet};
  CaptureConfig config_;
  PacketCallback on_packet_;
  ErrorCallback on_error_;
  std::atomic<bool> running_{false};
  std::thread capture_thread_;
  mutable std::mutex error_mutex_;  // guards last_error_*; written from the capture thread
  std::string last_error_code_;
  std::string last_error_message_;
  std::atomic<uint64_t> datagrams_{0};
  std::atomic<uint64_t> decode_failures_{0};
  unsigned int last_ps_recv_{0};
  unsigned int last_ps_drop_{0};
  unsigned int last_ps_ifdrop_{0};
  bool last_stats_valid_{false};
};

}  // namespace rfc5444

#endif  // RFC5444_CAPTURE_HPP
