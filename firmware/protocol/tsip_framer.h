#pragma once

#include <cstddef>
#include <cstdint>

namespace tbolt {
namespace protocol {

/**
 * One unstuffed TSIP payload: report id at data[0], no DLE/ETX delimiters.
 * Points into the framer's buffer and is valid until the next push_byte().
 */
struct TsipFrameView {
  const uint8_t* data = nullptr;
  uint16_t len = 0;
};

enum class TsipFrameStatus : uint8_t {
  None = 0,
  FrameOk,
  FrameTooShort,  ///< DLE ETX with no report id; dropped.
  FrameDropped,   ///< Open frame abandoned because a new start arrived.
  Overflow,       ///< Frame grew past kMaxFrameLen; dropped, back to idle.
};

struct TsipFramerDiag {
  uint32_t frames_ok = 0;
  uint32_t frames_dropped = 0;
  uint32_t desync_bytes = 0;
};

using FrameCallback = void (*)(void* ctx, const TsipFrameView& frame);

/**
 * Byte-at-a-time TSIP reassembly.
 *
 * Wire format: DLE <id> <data...> DLE ETX, where any 0x10 data byte is sent
 * as DLE DLE. Bytes seen outside a frame are discarded. Inside a frame,
 * DLE followed by anything other than DLE or ETX starts a new frame and the
 * partial one is dropped. State is kept between calls, so a frame may be
 * split across any number of reads.
 */
class TsipFramer {
 public:
  static constexpr uint8_t kDle = 0x10;
  static constexpr uint8_t kEtx = 0x03;
  static constexpr size_t kMinFrameLen = 1;
  static constexpr size_t kMaxFrameLen = 256;

  TsipFrameStatus push_byte(uint8_t byte, TsipFrameView* out_frame);

  /** Push a chunk; cb runs once per completed frame. Returns frames emitted. */
  size_t feed(const uint8_t* data, size_t len, FrameCallback cb, void* ctx);

  void reset();
  bool in_frame() const;
  const TsipFramerDiag& diag() const;

 private:
  enum class State : uint8_t {
    kIdle = 0,
    kStart,    // DLE seen outside a frame
    kData,
    kDataDle,  // DLE seen inside a frame
  };

  TsipFrameStatus append(uint8_t byte);
  void open_frame();

  State state_ = State::kIdle;
  uint16_t len_ = 0;
  uint8_t buffer_[kMaxFrameLen] = {};
  TsipFramerDiag diag_{};
};

} // namespace protocol
} // namespace tbolt
