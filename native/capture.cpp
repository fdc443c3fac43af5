/**
 * RFC 5444 Decoder: capture implementation.
 * Linux + libpcap only.
 */

#include "capture.hpp"
#include <pcap.h>
#include <cstdio>

namespace rfc5444 {

namespace {

void packet_handler(u_char* user, const struct pcap_pkthdr* h, const u_char* bytes) {
  CaptureEngine* eng = reinterpret_cast<CaptureEngine*>(user);
  uint64_t ts = static_cast<uint64_t>(h->ts.tv_sec) * 1000000u + static_cast<uint64_t>(h->ts.tv_usec);
  eng->dispatch_frame(bytes, h->caplen, ts);
}

bool supported_link_type(int dlt) {
  return dlt == kLinkEthernet || dlt == kLinkRaw || dlt == kLinkLinuxSll;
}

}  // namespace

CaptureEngine::CaptureEngine() = default;

CaptureEngine::~CaptureEngine() {
  stop();
}

void CaptureEngine::dispatch_frame(const uint8_t* data, size_t caplen, uint64_t timestamp_us) {
  ManetDatagram datagram;
  if (!decode_frame(data, caplen, link_type_, config_.ports, datagram)) return;

  CapturedPacket pkt;
  pkt.tuple = datagram.tuple;
  pkt.timestamp_us = timestamp_us;
  pkt.payload = datagram.payload;
  pkt.payload_len = datagram.payload_len;
  pkt.status = validate_packet(datagram.payload, datagram.payload_len);
  if (pkt.status == DecodeError::kNone) {
    // validate_packet already accepted the header, so this cannot fail
    pkt.status = decode_packet(datagram.payload, datagram.payload_len, pkt.packet);
  }

  datagrams_++;
  if (pkt.status != DecodeError::kNone) {
    decode_failures_++;
    log_decode_error(pkt);
  }
  if (on_packet_) on_packet_(pkt);
}

std::string CaptureEngine::build_bpf_filter(const std::vector<uint16_t>& ports) const {
  if (ports.empty()) return "udp port " + std::to_string(kManetPort);
  std::string filter = "udp port " + std::to_string(ports[0]);
  for (size_t i = 1; i < ports.size(); ++i) {
    filter += " or udp port " + std::to_string(ports[i]);
  }
  return filter;
}

void CaptureEngine::report_error(const std::string& code, const std::string& message) {
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_code_ = code;
    last_error_message_ = message;
  }
  fprintf(stderr, "[rfc5444] capture_error code=%s message=%s\n", code.c_str(), message.c_str());
  if (on_error_) on_error_(code, message);
}

std::string CaptureEngine::last_error_code() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_code_;
}

std::string CaptureEngine::last_error_message() const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  return last_error_message_;
}

void CaptureEngine::log_decode_error(const CapturedPacket& pkt) const {
  fprintf(stderr, "[rfc5444] decode_error src=%s dst=%s len=%zu kind=%s\n",
          format_endpoint(pkt.tuple.src_ip, pkt.tuple.src_port).c_str(),
          format_endpoint(pkt.tuple.dst_ip, pkt.tuple.dst_port).c_str(),
          pkt.payload_len, to_string(pkt.status));
}

bool CaptureEngine::open_handle(std::string* source) {
  char errbuf[PCAP_ERRBUF_SIZE];
  errbuf[0] = '\0';
  if (!config_.capture_file.empty()) {
    *source = config_.capture_file;
    pcap_handle_ = pcap_open_offline(config_.capture_file.c_str(), errbuf);
  } else {
    *source = config_.interface_name.empty() ? "any" : config_.interface_name;
    pcap_handle_ = pcap_open_live(source->c_str(), config_.snaplen, config_.promiscuous ? 1 : 0,
                                  config_.read_timeout_ms, errbuf);
  }
  if (pcap_handle_ == nullptr) {
    const char* fn = config_.capture_file.empty() ? "pcap_open_live" : "pcap_open_offline";
    report_error("CAPTURE_OPEN_FAILED", std::string(fn) + ": " + errbuf);
    return false;
  }

  link_type_ = pcap_datalink(pcap_handle_);
  if (!supported_link_type(link_type_)) {
    report_error("CAPTURE_OPEN_FAILED", "unsupported datalink " + std::to_string(link_type_));
    close_handle(false);
    return false;
  }
  return true;
}

bool CaptureEngine::apply_filter(const std::string& filter) {
  bpf_program_ = new bpf_program{};
  if (pcap_compile(pcap_handle_, bpf_program_, filter.c_str(), 1, PCAP_NETMASK_UNKNOWN) != 0) {
    report_error("CAPTURE_OPEN_FAILED", std::string("pcap_compile: ") + pcap_geterr(pcap_handle_));
    // nothing was compiled, so there is no code to free
    delete bpf_program_;
    bpf_program_ = nullptr;
    close_handle(false);
    return false;
  }
  if (pcap_setfilter(pcap_handle_, bpf_program_) != 0) {
    report_error("CAPTURE_OPEN_FAILED", std::string("pcap_setfilter: ") + pcap_geterr(pcap_handle_));
    close_handle(false);
    return false;
  }
  return true;
}

void CaptureEngine::log_startup(const std::string& source, const std::string& filter) const {
  std::string ports;
  for (uint16_t port : config_.ports) {
    if (!ports.empty()) ports += ",";
    ports += std::to_string(port);
  }
  fprintf(stderr,
          "{\"timestamp\":\"startup\",\"level\":\"info\",\"message\":\"capture started\","
          "\"%s\":\"%s\",\"linktype\":%d,\"filter\":\"%s\",\"ports\":[%s]}\n",
          config_.capture_file.empty() ? "interface" : "file", source.c_str(), link_type_,
          filter.c_str(), ports.c_str());
}

bool CaptureEngine::start(const CaptureConfig& config,
                          PacketCallback on_packet,
                          ErrorCallback on_error) {
  if (running_ || pcap_handle_ != nullptr) {
    report_error("UNRECOVERABLE", "capture already running");
    return false;
  }
  config_ = config;
  if (config_.ports.empty()) config_.ports.push_back(kManetPort);
  on_packet_ = std::move(on_packet);
  on_error_ = std::move(on_error);
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_code_.clear();
    last_error_message_.clear();
  }
  last_stats_valid_ = false;
  datagrams_ = 0;
  decode_failures_ = 0;

  std::string source;
  if (!open_handle(&source)) return false;
  std::string filter = build_bpf_filter(config_.ports);
  if (!apply_filter(filter)) return false;
  log_startup(source, filter);

  running_ = true;
  capture_thread_ = std::thread(&CaptureEngine::run_loop, this);
  return true;
}

void CaptureEngine::stop() {
  if (!running_ && pcap_handle_ == nullptr) return;
  if (pcap_handle_ != nullptr) {
    pcap_breakloop(pcap_handle_);
  }
  wait();
}

void CaptureEngine::wait() {
  if (capture_thread_.joinable()) {
    capture_thread_.join();
  }
  running_ = false;
  close_handle(true);
}

void CaptureEngine::close_handle(bool record_stats) {
  if (pcap_handle_ == nullptr) return;
  if (record_stats && config_.capture_file.empty()) {
    struct pcap_stat ps;
    if (pcap_stats(pcap_handle_, &ps) == 0) {
      last_ps_recv_ = ps.ps_recv;
      last_ps_drop_ = ps.ps_drop;
      last_ps_ifdrop_ = ps.ps_ifdrop;
      last_stats_valid_ = true;
    }
  }
  if (bpf_program_ != nullptr) {
    pcap_freecode(bpf_program_);
    delete bpf_program_;
    bpf_program_ = nullptr;
  }
  pcap_close(pcap_handle_);
  pcap_handle_ = nullptr;
}

void CaptureEngine::run_loop() {
  if (pcap_handle_ == nullptr) return;
  int r = pcap_loop(pcap_handle_, -1, packet_handler, reinterpret_cast<u_char*>(this));
  if (r == PCAP_ERROR) {
    report_error("UNRECOVERABLE", std::string("pcap_loop: ") + pcap_geterr(pcap_handle_));
  }
  running_ = false;
}

}  // namespace rfc5444
