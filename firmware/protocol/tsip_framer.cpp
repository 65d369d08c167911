#include "tsip_framer.h"

namespace tbolt {
namespace protocol {

constexpr uint8_t TsipFramer::kDle;
constexpr uint8_t TsipFramer::kEtx;
constexpr size_t TsipFramer::kMinFrameLen;
constexpr size_t TsipFramer::kMaxFrameLen;

void TsipFramer::reset() {
  state_ = State::kIdle;
  len_ = 0;
}

bool TsipFramer::in_frame() const {
  return state_ == State::kData || state_ == State::kDataDle;
}

const TsipFramerDiag& TsipFramer::diag() const {
  return diag_;
}

void TsipFramer::open_frame() {
  len_ = 0;
  state_ = State::kData;
}

TsipFrameStatus TsipFramer::append(uint8_t byte) {
  if (len_ >= kMaxFrameLen) {
    ++diag_.frames_dropped;
    reset();
    return TsipFrameStatus::Overflow;
  }
  buffer_[len_++] = byte;
  return TsipFrameStatus::None;
}

TsipFrameStatus TsipFramer::push_byte(uint8_t byte, TsipFrameView* out_frame) {
  if (!out_frame) {
    reset();
    return TsipFrameStatus::None;
  }

  switch (state_) {
    case State::kIdle:
      if (byte == kDle) {
        state_ = State::kStart;
      } else {
        ++diag_.desync_bytes;
      }
      return TsipFrameStatus::None;

    case State::kStart:
      if (byte == kDle) {
        // Repeated DLE between frames; the latest one is the candidate start.
        ++diag_.desync_bytes;
        return TsipFrameStatus::None;
      }
      if (byte == kEtx) {
        // DLE ETX with nothing between: no report id to dispatch on.
        ++diag_.frames_dropped;
        reset();
        return TsipFrameStatus::FrameTooShort;
      }
      open_frame();
      return append(byte);

    case State::kData:
      if (byte == kDle) {
        state_ = State::kDataDle;
        return TsipFrameStatus::None;
      }
      return append(byte);

    case State::kDataDle:
      if (byte == kDle) {
        state_ = State::kData;
        return append(kDle);
      }
      if (byte == kEtx) {
        const uint16_t len = len_;
        reset();
        if (len < kMinFrameLen) {
          ++diag_.frames_dropped;
          return TsipFrameStatus::FrameTooShort;
        }
        out_frame->data = buffer_;
        out_frame->len = len;
        ++diag_.frames_ok;
        return TsipFrameStatus::FrameOk;
      }
      // DLE <id>: the previous frame never saw its DLE ETX.
      ++diag_.frames_dropped;
      open_frame();
      if (append(byte) == TsipFrameStatus::Overflow) {
        return TsipFrameStatus::Overflow;
      }
      return TsipFrameStatus::FrameDropped;
  }

  reset();
  return TsipFrameStatus::None;
}

size_t TsipFramer::feed(const uint8_t* data, size_t len, FrameCallback cb, void* ctx) {
  if (!data) {
    return 0;
  }
  size_t emitted = 0;
  for (size_t i = 0; i < len; ++i) {
    TsipFrameView frame{};
    if (push_byte(data[i], &frame) != TsipFrameStatus::FrameOk) {
      continue;
    }
    ++emitted;
    if (cb) {
      cb(ctx, frame);
    }
  }
  return emitted;
}

} // namespace protocol
} // namespace tbolt
