/**
 * @file Image3D.cpp
 * @brief Implementation of the 3D voxel volume
 */

#include "ImageIO.h"
#include <algorithm>
#include <set>

namespace neuroparcel {
namespace io {

template <typename PixelType>
Image3D<PixelType>::Image3D(const SizeType &size) {
  Allocate(size);
}

template <typename PixelType>
Image3D<PixelType>::Image3D(size_t nx, size_t ny, size_t nz) {
  SizeType size = {{nx, ny, nz}};
  Allocate(size);
}

template <typename PixelType>
PixelType &Image3D<PixelType>::operator()(size_t x, size_t y, size_t z) {
  IndexType index = {
      {static_cast<int>(x), static_cast<int>(y), static_cast<int>(z)}};
  return At(index);
}

template <typename PixelType>
const PixelType &Image3D<PixelType>::operator()(size_t x, size_t y,
                                                size_t z) const {
  IndexType index = {
      {static_cast<int>(x), static_cast<int>(y), static_cast<int>(z)}};
  return At(index);
}

template <typename PixelType>
PixelType &Image3D<PixelType>::At(const IndexType &index) {
  if (!IsIndexValid(index)) {
    throw std::out_of_range("Image index out of bounds");
  }
  return m_data[IndexToLinear(index)];
}

template <typename PixelType>
const PixelType &Image3D<PixelType>::At(const IndexType &index) const {
  if (!IsIndexValid(index)) {
    throw std::out_of_range("Image index out of bounds");
  }
  return m_data[IndexToLinear(index)];
}

template <typename PixelType>
PixelType &Image3D<PixelType>::operator[](size_t linear_index) {
  if (linear_index >= m_data.size()) {
    throw std::out_of_range("Linear index out of bounds");
  }
  return m_data[linear_index];
}

template <typename PixelType>
const PixelType &Image3D<PixelType>::operator[](size_t linear_index) const {
  if (linear_index >= m_data.size()) {
    throw std::out_of_range("Linear index out of bounds");
  }
  return m_data[linear_index];
}

template <typename PixelType>
size_t Image3D<PixelType>::GetTotalPixels() const {
  return m_info.dimensions[0] * m_info.dimensions[1] * m_info.dimensions[2];
}

template <typename PixelType>
void Image3D<PixelType>::Fill(const PixelType &value) {
  std::fill(m_data.begin(), m_data.end(), value);
}

template <typename PixelType>
void Image3D<PixelType>::Allocate(const SizeType &size) {
  m_info = ImageInfo();
  m_info.dimensions = size;
  size_t total_pixels = GetTotalPixels();

  if (total_pixels == 0) {
    m_data.clear();
    m_is_valid = false;
    return;
  }

  m_data.assign(total_pixels, PixelType());
  m_is_valid = true;
}

template <typename PixelType> void Image3D<PixelType>::Clear() {
  m_data.clear();
  m_info = ImageInfo();
  m_is_valid = false;
}

template <typename PixelType>
size_t Image3D<PixelType>::IndexToLinear(const IndexType &index) const {
  return static_cast<size_t>(index[2]) * m_info.dimensions[0] *
             m_info.dimensions[1] +
         static_cast<size_t>(index[1]) * m_info.dimensions[0] +
         static_cast<size_t>(index[0]);
}

template <typename PixelType>
typename Image3D<PixelType>::IndexType
Image3D<PixelType>::LinearToIndex(size_t linear_index) const {
  IndexType index;
  size_t xy_plane_size = m_info.dimensions[0] * m_info.dimensions[1];

  index[2] = static_cast<int>(linear_index / xy_plane_size);
  linear_index %= xy_plane_size;

  index[1] = static_cast<int>(linear_index / m_info.dimensions[0]);
  index[0] = static_cast<int>(linear_index % m_info.dimensions[0]);

  return index;
}

template <typename PixelType>
bool Image3D<PixelType>::IsIndexValid(const IndexType &index) const {
  return index[0] >= 0 && index[0] < static_cast<int>(m_info.dimensions[0]) &&
         index[1] >= 0 && index[1] < static_cast<int>(m_info.dimensions[1]) &&
         index[2] >= 0 && index[2] < static_cast<int>(m_info.dimensions[2]);
}

template <typename PixelType>
PixelType Image3D<PixelType>::GetMinValue() const {
  if (m_data.empty()) {
    return PixelType();
  }
  return *std::min_element(m_data.begin(), m_data.end());
}

template <typename PixelType>
PixelType Image3D<PixelType>::GetMaxValue() const {
  if (m_data.empty()) {
    return PixelType();
  }
  return *std::max_element(m_data.begin(), m_data.end());
}

template <typename PixelType>
size_t Image3D<PixelType>::CountNonZero() const {
  return static_cast<size_t>(
      std::count_if(m_data.begin(), m_data.end(),
                    [](const PixelType &value) { return value != 0; }));
}

template <typename PixelType>
size_t Image3D<PixelType>::CountValue(const PixelType &value) const {
  return static_cast<size_t>(std::count(m_data.begin(), m_data.end(), value));
}

template <typename PixelType>
std::vector<PixelType> Image3D<PixelType>::GetUniqueValues() const {
  std::set<PixelType> values;

  // Label volumes are dominated by long runs of the same value
  PixelType previous = PixelType();
  bool have_previous = false;
  for (const auto &value : m_data) {
    if (have_previous && value == previous) {
      continue;
    }
    previous = value;
    have_previous = true;
    if (value != 0) {
      values.insert(value);
    }
  }

  return std::vector<PixelType>(values.begin(), values.end());
}

// ===== Explicit Template Instantiations =====
template class Image3D<uint8_t>;
template class Image3D<uint16_t>;
template class Image3D<uint32_t>;

} // namespace io
} // namespace neuroparcel
