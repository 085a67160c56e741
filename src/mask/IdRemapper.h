/**
 * @file IdRemapper.h
 * @brief Compaction of region IDs that exceed the output pixel range
 */

#ifndef NEUROPARCEL_ID_REMAPPER_H
#define NEUROPARCEL_ID_REMAPPER_H

#include "../core/NeuroParcelExceptions.h"
#include "../io/ImageIO.h"
#include <limits>
#include <map>
#include <sstream>

namespace neuroparcel {
namespace mask {

struct RemapResult {
  io::LabelImage mask;
  std::map<uint32_t, uint32_t> old_to_new;
  std::map<uint32_t, uint32_t> new_to_old;
};

class IdRemapper {
public:
  // Throws ConfigurationException when max_value is 0
  explicit IdRemapper(uint32_t max_value = 65535);

  /**
   * @brief Moves every ID above the maximum onto an unused ID in [1, max]
   *
   * Over-range IDs, in ascending order, take the ascending IDs of [1, max]
   * not already present in the mask. In-range IDs are left untouched.
   * Throws RemapExhaustedException before any voxel changes when there are
   * fewer free slots than over-range IDs.
   */
  RemapResult Apply(const io::LabelImage &mask) const;

  uint32_t GetMaxValue() const { return m_max_value; }

private:
  uint32_t m_max_value;
};

/**
 * @brief Narrows a label volume to a storage pixel type
 *
 * Throws ImageProcessingException on the first value that does not fit.
 */
template <typename T>
io::Image3D<T> ToOutputImage(const io::LabelImage &mask) {
  io::Image3D<T> output(mask.GetSize());
  output.SetImageInfo(mask.GetImageInfo());

  const uint32_t limit = static_cast<uint32_t>(std::numeric_limits<T>::max());
  const uint32_t *input = mask.GetDataPointer();
  T *data = output.GetDataPointer();

  for (size_t i = 0; i < mask.GetTotalPixels(); ++i) {
    if (input[i] > limit) {
      auto index = mask.LinearToIndex(i);
      std::ostringstream problem;
      problem << "label " << input[i] << " at voxel (" << index[0] << ", "
              << index[1] << ", " << index[2] << ") exceeds " << limit;
      throw ImageProcessingException("ToOutputImage", problem.str());
    }
    data[i] = static_cast<T>(input[i]);
  }
  return output;
}

} // namespace mask
} // namespace neuroparcel

#endif // NEUROPARCEL_ID_REMAPPER_H
