#include "msig/script/script.hpp"

#include <stdexcept>

namespace msig {

void AppendPushData(std::span<const uint8_t> data, Bytes* script) {
  const size_t size = data.size();
  if (size < OP_PUSHDATA1) {
    script->push_back(static_cast<uint8_t>(size));
  } else if (size <= 0xFF) {
    script->push_back(OP_PUSHDATA1);
    script->push_back(static_cast<uint8_t>(size));
  } else if (size <= 0xFFFF) {
    script->push_back(OP_PUSHDATA2);
    script->push_back(static_cast<uint8_t>(size & 0xFF));
    script->push_back(static_cast<uint8_t>((size >> 8) & 0xFF));
  } else if (size <= 0xFFFFFFFFu) {
    script->push_back(OP_PUSHDATA4);
    for (int shift = 0; shift < 32; shift += 8) {
      script->push_back(static_cast<uint8_t>((size >> shift) & 0xFF));
    }
  } else {
    throw std::invalid_argument("Push data exceeds uint32 length");
  }
  script->insert(script->end(), data.begin(), data.end());
}

void AppendSmallInt(uint32_t value, Bytes* script) {
  if (value > 16) {
    throw std::invalid_argument("Small integer opcode must encode 0..16");
  }
  script->push_back(value == 0 ? static_cast<uint8_t>(OP_0) : static_cast<uint8_t>(OP_1 + value - 1));
}

bool DecodeSmallInt(uint8_t opcode, uint32_t* value) {
  if (opcode == OP_0) {
    *value = 0;
    return true;
  }
  if (opcode >= OP_1 && opcode <= OP_16) {
    *value = static_cast<uint32_t>(opcode - OP_1 + 1);
    return true;
  }
  return false;
}

Bytes BuildPushOnlyScript(const std::vector<Bytes>& elements) {
  Bytes script;
  for (const Bytes& element : elements) {
    if (element.empty()) {
      script.push_back(OP_0);
    } else {
      AppendPushData(element, &script);
    }
  }
  return script;
}

}  // namespace msig
