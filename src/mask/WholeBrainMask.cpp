/**
 * @file WholeBrainMask.cpp
 * @brief Binary brain outline from the raw annotation
 */

#include "WholeBrainMask.h"

namespace neuroparcel {
namespace mask {

io::BinaryMaskImage CreateWholeBrainMask(const io::LabelImage &labels) {
  io::BinaryMaskImage brain(labels.GetSize());
  brain.SetImageInfo(labels.GetImageInfo());

  const uint32_t *input = labels.GetDataPointer();
  uint8_t *output = brain.GetDataPointer();
  for (size_t i = 0; i < labels.GetTotalPixels(); ++i) {
    output[i] = input[i] != 0 ? 1 : 0;
  }
  return brain;
}

} // namespace mask
} // namespace neuroparcel
