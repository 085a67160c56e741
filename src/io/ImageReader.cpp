/**
 * @file ImageReader.cpp
 * @brief NIfTI-1 reading of integer label volumes
 */

#include "CompatUtils.h"
#include "ImageIO.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <type_traits>
#include <zlib.h>

namespace neuroparcel {
namespace io {

namespace {

// Converts stored voxels to the requested pixel type. Fails on values the
// target type cannot hold (negative labels, fractional labels, overflow).
template <typename StoredType, typename PixelType>
bool ConvertVoxels(const uint8_t *raw, PixelType *out, size_t count,
                   bool swap_bytes) {
  for (size_t i = 0; i < count; ++i) {
    StoredType value;
    std::memcpy(&value, raw + i * sizeof(StoredType), sizeof(StoredType));
    if (swap_bytes) {
      char *bytes = reinterpret_cast<char *>(&value);
      std::reverse(bytes, bytes + sizeof(StoredType));
    }

    if (std::is_floating_point<StoredType>::value) {
      double as_double = static_cast<double>(value);
      if (!std::isfinite(as_double) || std::floor(as_double) != as_double) {
        return false;
      }
      if (as_double < static_cast<double>(std::numeric_limits<PixelType>::min()) ||
          as_double > static_cast<double>(std::numeric_limits<PixelType>::max())) {
        return false;
      }
    } else {
      long double as_wide = static_cast<long double>(value);
      if (as_wide < static_cast<long double>(std::numeric_limits<PixelType>::min()) ||
          as_wide > static_cast<long double>(std::numeric_limits<PixelType>::max())) {
        return false;
      }
    }

    out[i] = static_cast<PixelType>(value);
  }
  return true;
}

} // namespace

// ===== ImageReader Implementation =====

ImageReader::ImageReader(const std::string &filename) : m_filename(filename) {
  Open(filename);
}

bool ImageReader::Open(const std::string &filename) {
  m_filename = filename;
  m_format = DetectFormat(filename);
  m_is_compressed = IsCompressed(filename);

  if (m_format != ImageFormat::NIFTI_1) {
    return false;
  }

  return ReadHeader();
}

void ImageReader::Close() {
  m_filename.clear();
  m_format = ImageFormat::UNKNOWN;
  m_datatype = DataType::UNKNOWN;
  m_is_compressed = false;
  m_swap_bytes = false;
  m_header = NiftiHeader();
}

ImageFormat ImageReader::DetectFormat(const std::string &filename) {
  if (IsNiftiFile(filename)) {
    return ImageFormat::NIFTI_1;
  }
  if (IsTiffFile(filename)) {
    return ImageFormat::TIFF;
  }
  return ImageFormat::UNKNOWN;
}

bool ImageReader::IsNiftiFile(const std::string &filename) {
  std::string lower_name = compat::to_lower(filename);
  return compat::ends_with(lower_name, ".nii") ||
         compat::ends_with(lower_name, ".nii.gz");
}

bool ImageReader::IsTiffFile(const std::string &filename) {
  std::string lower_name = compat::to_lower(filename);
  return compat::ends_with(lower_name, ".tif") ||
         compat::ends_with(lower_name, ".tiff");
}

bool ImageReader::IsCompressed(const std::string &filename) {
  return compat::ends_with(compat::to_lower(filename), ".gz");
}

bool ImageReader::ReadHeader() {
  if (m_format != ImageFormat::NIFTI_1) {
    return false;
  }
  return ReadNiftiHeader();
}

bool ImageReader::ReadNiftiHeader() {
  std::vector<uint8_t> header_bytes;

  if (m_is_compressed) {
    gzFile file = gzopen(m_filename.c_str(), "rb");
    if (!file) {
      return false;
    }
    header_bytes.resize(sizeof(NiftiHeader));
    int bytes_read = gzread(file, header_bytes.data(),
                            static_cast<unsigned int>(header_bytes.size()));
    gzclose(file);
    if (bytes_read != static_cast<int>(sizeof(NiftiHeader))) {
      return false;
    }
  } else {
    std::ifstream file(m_filename, std::ios::binary);
    if (!file.is_open()) {
      return false;
    }
    header_bytes.resize(sizeof(NiftiHeader));
    file.read(reinterpret_cast<char *>(header_bytes.data()),
              header_bytes.size());
    if (file.gcount() != static_cast<std::streamsize>(sizeof(NiftiHeader))) {
      return false;
    }
  }

  std::memcpy(&m_header, header_bytes.data(), sizeof(NiftiHeader));

  // A byte-swapped header announces itself through sizeof_hdr
  m_swap_bytes = false;
  if (m_header.sizeof_hdr != 348) {
    int32_t swapped = m_header.sizeof_hdr;
    SwapEndianness(swapped);
    if (swapped != 348) {
      return false;
    }
    m_swap_bytes = true;
  }

  if (m_swap_bytes) {
    SwapEndianness(m_header.sizeof_hdr);
    for (int i = 0; i < 8; ++i) {
      SwapEndianness(m_header.dim[i]);
      SwapEndianness(m_header.pixdim[i]);
    }
    SwapEndianness(m_header.datatype);
    SwapEndianness(m_header.bitpix);
    SwapEndianness(m_header.vox_offset);
    SwapEndianness(m_header.scl_slope);
    SwapEndianness(m_header.scl_inter);
    SwapEndianness(m_header.qoffset_x);
    SwapEndianness(m_header.qoffset_y);
    SwapEndianness(m_header.qoffset_z);
  }

  if (std::strncmp(m_header.magic, "n+1", 3) != 0) {
    return false;
  }

  if (m_header.dim[0] < 1 || m_header.dim[0] > 7) {
    return false;
  }

  m_datatype = NiftiDataTypeToDataType(m_header.datatype);
  return m_datatype != DataType::UNKNOWN;
}

template <typename PixelType>
std::unique_ptr<Image3D<PixelType>>
ImageReader::ReadImage(const ReadOptions &options) {
  if (!ReadHeader()) {
    return nullptr;
  }

  auto image = std::make_unique<Image3D<PixelType>>();

  if (!ReadImageData(image.get(), options)) {
    return nullptr;
  }

  return image;
}

std::unique_ptr<LabelImage>
ImageReader::ReadLabelImage(const ReadOptions &options) {
  return ReadImage<uint32_t>(options);
}

template <typename PixelType>
bool ImageReader::ReadImageData(Image3D<PixelType> *image,
                                const ReadOptions &options) {
  if (!image) {
    return false;
  }

  // Only the first volume of a 4D file is a label map
  for (int i = 4; i <= m_header.dim[0]; ++i) {
    if (m_header.dim[i] > 1) {
      if (options.verbose) {
        std::cout << "Label volume has more than three dimensions: "
                  << m_filename << std::endl;
      }
      return false;
    }
  }

  auto dimensions = GetImageDimensions();
  typename Image3D<PixelType>::SizeType size = {
      {dimensions[0], dimensions[1], dimensions[2]}};

  size_t num_pixels = dimensions[0] * dimensions[1] * dimensions[2];
  size_t required_memory = num_pixels * sizeof(PixelType);
  if (options.memory_limit_mb > 0) {
    size_t limit_bytes = options.memory_limit_mb * 1024 * 1024;
    if (required_memory > limit_bytes) {
      if (options.verbose) {
        std::cout << "Image requires " << (required_memory / 1024 / 1024)
                  << " MB, limit is " << options.memory_limit_mb << " MB"
                  << std::endl;
      }
      return false;
    }
  }

  image->Allocate(size);

  ImageInfo info = image->GetImageInfo();
  auto voxel_size = GetVoxelSize();
  info.voxel_size = {{voxel_size[0], voxel_size[1], voxel_size[2]}};
  info.origin = {{m_header.qoffset_x, m_header.qoffset_y, m_header.qoffset_z}};
  info.description = GetDescription();
  image->SetImageInfo(info);

  if (options.read_header_only) {
    return true;
  }

  // Labels are stored verbatim; a scaled file is not a label map
  if (m_header.scl_slope != 0.0f &&
      (m_header.scl_slope != 1.0f || m_header.scl_inter != 0.0f)) {
    if (options.verbose) {
      std::cout << "Intensity scaling is not supported for label volumes"
                << std::endl;
    }
    return false;
  }

  std::vector<uint8_t> file_data = LoadFileData();
  size_t data_offset = static_cast<size_t>(m_header.vox_offset);
  size_t bytes_per_pixel = GetBytesPerPixel(m_datatype);

  if (file_data.size() < data_offset ||
      file_data.size() - data_offset < num_pixels * bytes_per_pixel) {
    return false;
  }

  const uint8_t *raw_data = file_data.data() + data_offset;
  PixelType *image_data = image->GetDataPointer();

  switch (m_datatype) {
  case DataType::UINT8:
    return ConvertVoxels<uint8_t>(raw_data, image_data, num_pixels,
                                  m_swap_bytes);
  case DataType::INT8:
    return ConvertVoxels<int8_t>(raw_data, image_data, num_pixels,
                                 m_swap_bytes);
  case DataType::UINT16:
    return ConvertVoxels<uint16_t>(raw_data, image_data, num_pixels,
                                   m_swap_bytes);
  case DataType::INT16:
    return ConvertVoxels<int16_t>(raw_data, image_data, num_pixels,
                                  m_swap_bytes);
  case DataType::UINT32:
    return ConvertVoxels<uint32_t>(raw_data, image_data, num_pixels,
                                   m_swap_bytes);
  case DataType::INT32:
    return ConvertVoxels<int32_t>(raw_data, image_data, num_pixels,
                                  m_swap_bytes);
  case DataType::FLOAT32:
    return ConvertVoxels<float>(raw_data, image_data, num_pixels,
                                m_swap_bytes);
  case DataType::FLOAT64:
    return ConvertVoxels<double>(raw_data, image_data, num_pixels,
                                 m_swap_bytes);
  default:
    return false;
  }
}

std::array<size_t, 3> ImageReader::GetImageDimensions() const {
  std::array<size_t, 3> dims = {{1, 1, 1}};
  for (int i = 0; i < 3; ++i) {
    if (i < m_header.dim[0]) {
      dims[i] = static_cast<size_t>(
          std::max(1, static_cast<int>(m_header.dim[i + 1])));
    }
  }
  return dims;
}

std::array<double, 3> ImageReader::GetVoxelSize() const {
  return {
      {static_cast<double>(m_header.pixdim[1] > 0 ? m_header.pixdim[1] : 1.0),
       static_cast<double>(m_header.pixdim[2] > 0 ? m_header.pixdim[2] : 1.0),
       static_cast<double>(m_header.pixdim[3] > 0 ? m_header.pixdim[3] : 1.0)}};
}

size_t ImageReader::GetImageSizeBytes() const {
  auto dims = GetImageDimensions();
  return dims[0] * dims[1] * dims[2] * GetBytesPerPixel(m_datatype);
}

std::string ImageReader::GetDescription() const {
  return std::string(m_header.descrip, strnlen(m_header.descrip, 80));
}

DataType ImageReader::NiftiDataTypeToDataType(int16_t nifti_type) {
  switch (nifti_type) {
  case 2:
    return DataType::UINT8;
  case 4:
    return DataType::INT16;
  case 8:
    return DataType::INT32;
  case 16:
    return DataType::FLOAT32;
  case 64:
    return DataType::FLOAT64;
  case 256:
    return DataType::INT8;
  case 512:
    return DataType::UINT16;
  case 768:
    return DataType::UINT32;
  default:
    return DataType::UNKNOWN;
  }
}

size_t ImageReader::GetBytesPerPixel(DataType type) {
  switch (type) {
  case DataType::UINT8:
  case DataType::INT8:
    return 1;
  case DataType::UINT16:
  case DataType::INT16:
    return 2;
  case DataType::UINT32:
  case DataType::INT32:
  case DataType::FLOAT32:
    return 4;
  case DataType::FLOAT64:
    return 8;
  default:
    return 0;
  }
}

std::vector<uint8_t> ImageReader::LoadFileData() const {
  if (m_is_compressed) {
    return DecompressGzip(m_filename);
  }

  std::ifstream file(m_filename, std::ios::binary);
  if (!file.is_open()) {
    return {};
  }

  file.seekg(0, std::ios::end);
  std::streamoff file_size = file.tellg();
  if (file_size <= 0) {
    return {};
  }
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> file_data(static_cast<size_t>(file_size));
  file.read(reinterpret_cast<char *>(file_data.data()), file_size);
  if (file.gcount() != file_size) {
    return {};
  }
  return file_data;
}

std::vector<uint8_t>
ImageReader::DecompressGzip(const std::string &filename) const {
  gzFile file = gzopen(filename.c_str(), "rb");
  if (!file) {
    return {};
  }

  std::vector<uint8_t> data;
  const unsigned int buffer_size = 1024 * 1024; // 1MB buffer
  std::vector<uint8_t> buffer(buffer_size);

  int bytes_read;
  while ((bytes_read = gzread(file, buffer.data(), buffer_size)) > 0) {
    data.insert(data.end(), buffer.begin(), buffer.begin() + bytes_read);
  }

  gzclose(file);

  if (bytes_read < 0) {
    return {};
  }

  return data;
}

template <typename T> void ImageReader::SwapEndianness(T &value) {
  char *bytes = reinterpret_cast<char *>(&value);
  std::reverse(bytes, bytes + sizeof(T));
}

// Explicit template instantiations
template std::unique_ptr<Image3D<uint32_t>>
ImageReader::ReadImage<uint32_t>(const ReadOptions &);

} // namespace io
} // namespace neuroparcel
