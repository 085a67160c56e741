/**
 * @file ImageUtils.cpp
 * @brief Format dispatch and file helpers
 */

#include "CompatUtils.h"
#include "ImageIO.h"
#include <filesystem>
#include <iostream>

namespace neuroparcel {
namespace io {
namespace ImageUtils {

// ===== File Utilities =====

bool FileExists(const std::string &filename) {
  std::error_code ec;
  return std::filesystem::is_regular_file(filename, ec);
}

std::string GetFileExtension(const std::string &filename) {
  std::filesystem::path path(filename);
  std::string ext = path.extension().string();

  // Handle .nii.gz case
  if (ext == ".gz" && path.stem().extension() == ".nii") {
    return ".nii.gz";
  }

  return ext;
}

// ===== Quick I/O Functions =====

std::unique_ptr<LabelImage> ReadLabelImage(const std::string &filename,
                                           bool verbose) {
  if (!FileExists(filename)) {
    throw FileNotFoundException(filename);
  }

  std::unique_ptr<LabelImage> image;

  switch (ImageReader::DetectFormat(filename)) {
  case ImageFormat::TIFF:
    image = TiffImageIO::ReadLabelImage(filename);
    break;
  case ImageFormat::NIFTI_1: {
    ImageReader reader;
    if (!reader.Open(filename)) {
      throw CorruptedFileException(filename);
    }
    ImageReader::ReadOptions options;
    options.verbose = verbose;
    image = reader.ReadLabelImage(options);
    if (!image) {
      throw CorruptedFileException(filename);
    }
    break;
  }
  default:
    throw UnsupportedFormatException(GetFileExtension(filename));
  }

  if (verbose) {
    std::cout << "Loaded label volume " << filename << " ("
              << image->GetSizeX() << "x" << image->GetSizeY() << "x"
              << image->GetSizeZ() << ")" << std::endl;
  }

  return image;
}

template <typename PixelType>
void WriteImage(const Image3D<PixelType> &image, const std::string &filename,
                bool verbose) {
  switch (ImageReader::DetectFormat(filename)) {
  case ImageFormat::TIFF:
    TiffImageIO::WriteImage(image, filename);
    break;
  case ImageFormat::NIFTI_1: {
    ImageWriter writer;
    if (!writer.Open(filename, ImageFormat::NIFTI_1)) {
      throw ImageIOException("Cannot open '" + filename + "' for writing");
    }
    ImageWriter::WriteOptions options;
    options.verbose = verbose;
    if (!writer.WriteImage(image, options)) {
      throw ImageIOException("Failed to write '" + filename + "'");
    }
    break;
  }
  default:
    throw UnsupportedFormatException(GetFileExtension(filename));
  }

  if (verbose) {
    std::cout << "Wrote " << filename << std::endl;
  }
}

template void WriteImage<uint8_t>(const Image3D<uint8_t> &,
                                  const std::string &, bool);
template void WriteImage<uint16_t>(const Image3D<uint16_t> &,
                                   const std::string &, bool);
template void WriteImage<uint32_t>(const Image3D<uint32_t> &,
                                   const std::string &, bool);

} // namespace ImageUtils
} // namespace io
} // namespace neuroparcel
