/**
 * @file TiffImageIO.cpp
 * @brief Multi-page TIFF label stacks through ITK
 *
 * A TIFF stack of shape (pages, rows, columns) maps to an Image3D with
 * x = column, y = row, z = page, which is the layout Image3D stores.
 */

#include "ImageIO.h"

#include "itkImage.h"
#include "itkImageFileReader.h"
#include "itkImageFileWriter.h"
#include "itkImageRegionConstIterator.h"
#include "itkImageRegionIterator.h"
#include "itkTIFFImageIO.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace neuroparcel {
namespace io {

namespace {

template <typename PixelType>
typename itk::Image<PixelType, 3>::Pointer
ToItkImage(const Image3D<PixelType> &image) {
  using ItkImageType = itk::Image<PixelType, 3>;

  typename ItkImageType::SizeType size;
  typename ItkImageType::IndexType start;
  typename ItkImageType::SpacingType spacing;
  typename ItkImageType::PointType origin;
  for (unsigned int d = 0; d < 3; ++d) {
    size[d] = image.GetSize()[d];
    start[d] = 0;
    spacing[d] = image.GetSpacing()[d];
    origin[d] = image.GetOrigin()[d];
  }

  auto itk_image = ItkImageType::New();
  itk_image->SetRegions(typename ItkImageType::RegionType(start, size));
  itk_image->SetSpacing(spacing);
  itk_image->SetOrigin(origin);
  itk_image->Allocate();

  // Both layouts are x-fastest
  itk::ImageRegionIterator<ItkImageType> it(itk_image,
                                            itk_image->GetLargestPossibleRegion());
  const PixelType *data = image.GetDataPointer();
  for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++data) {
    it.Set(*data);
  }

  return itk_image;
}

} // namespace

bool TiffImageIO::CanReadFile(const std::string &filename) {
  auto tiff_io = itk::TIFFImageIO::New();
  return tiff_io->CanReadFile(filename.c_str());
}

std::unique_ptr<LabelImage>
TiffImageIO::ReadLabelImage(const std::string &filename) {
  using ItkLabelImage = itk::Image<uint32_t, 3>;
  using ReaderType = itk::ImageFileReader<ItkLabelImage>;

  if (!ImageUtils::FileExists(filename)) {
    throw FileNotFoundException(filename);
  }

  auto tiff_io = itk::TIFFImageIO::New();
  if (!tiff_io->CanReadFile(filename.c_str())) {
    throw CorruptedFileException(filename);
  }

  auto reader = ReaderType::New();
  reader->SetImageIO(tiff_io);
  reader->SetFileName(filename);

  try {
    reader->Update();
  } catch (const itk::ExceptionObject &e) {
    throw ImageIOException("Failed to read TIFF stack '" + filename +
                           "': " + e.GetDescription());
  }

  // Floating point or signed stacks are not label maps
  auto component = tiff_io->GetComponentType();
  if (component != itk::IOComponentEnum::UCHAR &&
      component != itk::IOComponentEnum::USHORT &&
      component != itk::IOComponentEnum::UINT) {
    throw UnsupportedFormatException(
        "TIFF component type " +
        itk::ImageIOBase::GetComponentTypeAsString(component) +
        " in '" + filename + "' (expected unsigned integer labels)");
  }

  ItkLabelImage::Pointer itk_image = reader->GetOutput();
  auto region = itk_image->GetLargestPossibleRegion();
  auto itk_size = region.GetSize();

  auto image = std::make_unique<LabelImage>(
      static_cast<size_t>(itk_size[0]), static_cast<size_t>(itk_size[1]),
      static_cast<size_t>(itk_size[2]));
  if (!image->IsValid()) {
    throw CorruptedFileException(filename);
  }

  ImageInfo info = image->GetImageInfo();
  for (unsigned int d = 0; d < 3; ++d) {
    info.voxel_size[d] = itk_image->GetSpacing()[d];
    info.origin[d] = itk_image->GetOrigin()[d];
  }
  info.description = filename;
  image->SetImageInfo(info);

  itk::ImageRegionConstIterator<ItkLabelImage> it(itk_image, region);
  uint32_t *data = image->GetDataPointer();
  for (it.GoToBegin(); !it.IsAtEnd(); ++it, ++data) {
    *data = it.Get();
  }

  return image;
}

template <typename PixelType>
void TiffImageIO::WriteImage(const Image3D<PixelType> &image,
                             const std::string &filename, bool compress) {
  using ItkImageType = itk::Image<PixelType, 3>;
  using WriterType = itk::ImageFileWriter<ItkImageType>;

  if (!image.IsValid()) {
    throw ImageIOException("Refusing to write an empty image to '" +
                           filename + "'");
  }

  auto writer = WriterType::New();
  writer->SetImageIO(itk::TIFFImageIO::New());
  writer->SetFileName(filename);
  writer->SetInput(ToItkImage(image));
  writer->SetUseCompression(compress);

  try {
    writer->Update();
  } catch (const itk::ExceptionObject &e) {
    std::error_code ec;
    std::filesystem::remove(filename, ec);
    throw ImageIOException("Failed to write TIFF stack '" + filename +
                           "': " + e.GetDescription());
  }
}

template void TiffImageIO::WriteImage<uint8_t>(const Image3D<uint8_t> &,
                                               const std::string &, bool);
template void TiffImageIO::WriteImage<uint16_t>(const Image3D<uint16_t> &,
                                                const std::string &, bool);
template void TiffImageIO::WriteImage<uint32_t>(const Image3D<uint32_t> &,
                                                const std::string &, bool);

} // namespace io
} // namespace neuroparcel
