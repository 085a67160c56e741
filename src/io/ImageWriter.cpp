/**
 * @file ImageWriter.cpp
 * @brief NIfTI-1 writing of integer label volumes
 */

#include "CompatUtils.h"
#include "ImageIO.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <type_traits>
#include <zlib.h>

namespace neuroparcel {
namespace io {

// ===== ImageWriter Implementation =====

ImageWriter::ImageWriter(const std::string &filename) : m_filename(filename) {
  Open(filename);
}

bool ImageWriter::Open(const std::string &filename, ImageFormat format) {
  m_filename = filename;
  m_format = format;

  if (m_format == ImageFormat::UNKNOWN) {
    m_format = ImageReader::DetectFormat(filename);
  }

  // TIFF stacks are written by TiffImageIO
  return m_format == ImageFormat::NIFTI_1;
}

void ImageWriter::Close() {
  m_filename.clear();
  m_format = ImageFormat::UNKNOWN;
}

template <typename PixelType>
bool ImageWriter::WriteImage(const Image3D<PixelType> &image,
                             const WriteOptions &options) {
  if (!image.IsValid() || m_format != ImageFormat::NIFTI_1) {
    return false;
  }

  for (size_t extent : image.GetSize()) {
    if (extent > static_cast<size_t>(std::numeric_limits<int16_t>::max())) {
      if (options.verbose) {
        std::cout << "Image extent " << extent
                  << " does not fit a NIfTI-1 header" << std::endl;
      }
      return false;
    }
  }

  NiftiHeader header = CreateNiftiHeader(image, options);
  size_t data_size = image.GetTotalPixels() * sizeof(PixelType);
  return WriteNiftiImage(image.GetDataPointer(), data_size, header, options);
}

template <typename PixelType>
NiftiHeader ImageWriter::CreateNiftiHeader(const Image3D<PixelType> &image,
                                           const WriteOptions &options) const {
  NiftiHeader header;

  header.dim[0] = 3;
  header.dim[1] = static_cast<int16_t>(image.GetSizeX());
  header.dim[2] = static_cast<int16_t>(image.GetSizeY());
  header.dim[3] = static_cast<int16_t>(image.GetSizeZ());
  header.dim[4] = 1;
  header.dim[5] = 1;
  header.dim[6] = 1;
  header.dim[7] = 1;

  header.pixdim[0] = 1.0f; // QFactor
  auto spacing = image.GetSpacing();
  header.pixdim[1] = static_cast<float>(spacing[0]);
  header.pixdim[2] = static_cast<float>(spacing[1]);
  header.pixdim[3] = static_cast<float>(spacing[2]);

  DataType output_type = GetDataTypeFromPixelType<PixelType>();
  header.datatype = DataTypeToNiftiDataType(output_type);
  header.bitpix = static_cast<int16_t>(sizeof(PixelType) * 8);

  // Labels are stored verbatim
  header.scl_slope = 1.0f;
  header.scl_inter = 0.0f;
  header.vox_offset = 352.0f;

  std::string description =
      options.description.empty() ? image.GetImageInfo().description
                                  : options.description;
  if (!description.empty()) {
    std::strncpy(header.descrip, description.c_str(), 79);
    header.descrip[79] = '\0';
  }

  std::memcpy(header.magic, "n+1", 4);

  header.qform_code = 1;
  header.sform_code = 1;

  auto origin = image.GetOrigin();
  header.qoffset_x = static_cast<float>(origin[0]);
  header.qoffset_y = static_cast<float>(origin[1]);
  header.qoffset_z = static_cast<float>(origin[2]);

  header.srow_x[0] = static_cast<float>(spacing[0]);
  header.srow_x[3] = static_cast<float>(origin[0]);
  header.srow_y[1] = static_cast<float>(spacing[1]);
  header.srow_y[3] = static_cast<float>(origin[1]);
  header.srow_z[2] = static_cast<float>(spacing[2]);
  header.srow_z[3] = static_cast<float>(origin[2]);

  return header;
}

bool ImageWriter::WriteNiftiImage(const void *data, size_t data_size,
                                  const NiftiHeader &header,
                                  const WriteOptions &options) {
  bool should_compress =
      options.compress || compat::ends_with(compat::to_lower(m_filename), ".gz");
  std::string output_filename = m_filename;
  if (should_compress && !compat::ends_with(compat::to_lower(m_filename), ".gz")) {
    output_filename += ".gz";
  }

  // Header, 4-byte empty extension block, voxels
  const char extension[4] = {0, 0, 0, 0};

  if (should_compress) {
    gzFile output = gzopen(output_filename.c_str(), "wb6");
    if (!output) {
      return false;
    }

    bool ok =
        gzwrite(output, &header, sizeof(header)) ==
            static_cast<int>(sizeof(header)) &&
        gzwrite(output, extension, sizeof(extension)) ==
            static_cast<int>(sizeof(extension));

    const char *bytes = static_cast<const char *>(data);
    const size_t chunk_size = 1024 * 1024;
    for (size_t offset = 0; ok && offset < data_size; offset += chunk_size) {
      unsigned int chunk = static_cast<unsigned int>(
          std::min(chunk_size, data_size - offset));
      ok = gzwrite(output, bytes + offset, chunk) == static_cast<int>(chunk);
    }

    if (gzclose(output) != Z_OK) {
      ok = false;
    }
    if (!ok) {
      std::remove(output_filename.c_str());
      return false;
    }
  } else {
    std::ofstream file(output_filename, std::ios::binary);
    if (!file.is_open()) {
      return false;
    }

    file.write(reinterpret_cast<const char *>(&header), sizeof(header));
    file.write(extension, sizeof(extension));
    file.write(static_cast<const char *>(data),
               static_cast<std::streamsize>(data_size));
    file.close();

    if (!file) {
      std::remove(output_filename.c_str());
      return false;
    }
  }

  if (options.verbose) {
    std::cout << "Image written to: " << output_filename << std::endl;
    std::cout << "  Dimensions: " << header.dim[1] << "x" << header.dim[2]
              << "x" << header.dim[3] << std::endl;
    std::cout << "  Data type: " << static_cast<int>(header.datatype)
              << std::endl;
  }

  return true;
}

int16_t ImageWriter::DataTypeToNiftiDataType(DataType type) {
  switch (type) {
  case DataType::UINT8:
    return 2;
  case DataType::INT16:
    return 4;
  case DataType::INT32:
    return 8;
  case DataType::FLOAT32:
    return 16;
  case DataType::FLOAT64:
    return 64;
  case DataType::INT8:
    return 256;
  case DataType::UINT16:
    return 512;
  case DataType::UINT32:
    return 768;
  default:
    return 0;
  }
}

template <typename PixelType>
DataType ImageWriter::GetDataTypeFromPixelType() {
  if constexpr (std::is_same_v<PixelType, uint8_t>)
    return DataType::UINT8;
  else if constexpr (std::is_same_v<PixelType, int8_t>)
    return DataType::INT8;
  else if constexpr (std::is_same_v<PixelType, uint16_t>)
    return DataType::UINT16;
  else if constexpr (std::is_same_v<PixelType, int16_t>)
    return DataType::INT16;
  else if constexpr (std::is_same_v<PixelType, uint32_t>)
    return DataType::UINT32;
  else if constexpr (std::is_same_v<PixelType, int32_t>)
    return DataType::INT32;
  else
    return DataType::UNKNOWN;
}

// Explicit template instantiations
template bool ImageWriter::WriteImage<uint8_t>(const Image3D<uint8_t> &,
                                               const WriteOptions &);
template bool ImageWriter::WriteImage<uint16_t>(const Image3D<uint16_t> &,
                                                const WriteOptions &);
template bool ImageWriter::WriteImage<uint32_t>(const Image3D<uint32_t> &,
                                                const WriteOptions &);

} // namespace io
} // namespace neuroparcel
