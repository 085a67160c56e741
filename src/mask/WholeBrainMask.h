/**
 * @file WholeBrainMask.h
 * @brief Binary brain/background mask of a label volume
 */

#ifndef NEUROPARCEL_WHOLE_BRAIN_MASK_H
#define NEUROPARCEL_WHOLE_BRAIN_MASK_H

#include "../io/ImageIO.h"

namespace neuroparcel {
namespace mask {

// 1 where `labels` is nonzero, 0 elsewhere; geometry is copied
io::BinaryMaskImage CreateWholeBrainMask(const io::LabelImage &labels);

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_WHOLE_BRAIN_MASK_H
