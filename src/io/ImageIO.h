/**
 * @file ImageIO.h
 * @brief Label volume container and image I/O
 *
 * Integer label volumes are held in Image3D. NIfTI-1 files (.nii, .nii.gz)
 * are read and written by the in-tree reader and writer; multi-page TIFF
 * stacks go through ITK's TIFF image IO.
 */

#ifndef NEUROPARCEL_IMAGE_IO_H
#define NEUROPARCEL_IMAGE_IO_H

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace neuroparcel {
namespace io {

/**
 * @brief Common image information structure
 */
struct ImageInfo {
  using SizeType = std::array<size_t, 3>;
  using SpacingType = std::array<double, 3>;
  using OriginType = std::array<double, 3>;

  SizeType dimensions = {{0, 0, 0}};              // [nx, ny, nz]
  SpacingType voxel_size = {{1.0, 1.0, 1.0}};     // [dx, dy, dz]
  OriginType origin = {{0.0, 0.0, 0.0}};          // [ox, oy, oz]
  std::array<std::array<double, 3>, 3> direction = {
      {{{1.0, 0.0, 0.0}}, {{0.0, 1.0, 0.0}}, {{0.0, 0.0, 1.0}}}};
  std::string description;
};

/**
 * @brief 3D voxel volume stored x-fastest (index = z*nx*ny + y*nx + x)
 */
template <typename PixelType> class Image3D {
public:
  using ValueType = PixelType;
  using IndexType = std::array<int, 3>;
  using SizeType = std::array<size_t, 3>;
  using SpacingType = std::array<double, 3>;
  using OriginType = std::array<double, 3>;
  using ImageInfo = neuroparcel::io::ImageInfo;

private:
  std::vector<PixelType> m_data;
  ImageInfo m_info;
  bool m_is_valid = false;

public:
  Image3D() = default;
  explicit Image3D(const SizeType &size);
  Image3D(size_t nx, size_t ny, size_t nz);
  ~Image3D() = default;

  Image3D(const Image3D &other) = default;
  Image3D &operator=(const Image3D &other) = default;
  Image3D(Image3D &&other) noexcept = default;
  Image3D &operator=(Image3D &&other) noexcept = default;

  // Data access
  PixelType &operator()(size_t x, size_t y, size_t z);
  const PixelType &operator()(size_t x, size_t y, size_t z) const;
  PixelType &At(const IndexType &index);
  const PixelType &At(const IndexType &index) const;

  // Linear index access
  PixelType &operator[](size_t linear_index);
  const PixelType &operator[](size_t linear_index) const;

  // Size and dimension queries
  const SizeType &GetSize() const { return m_info.dimensions; }
  size_t GetSizeX() const { return m_info.dimensions[0]; }
  size_t GetSizeY() const { return m_info.dimensions[1]; }
  size_t GetSizeZ() const { return m_info.dimensions[2]; }
  size_t GetTotalPixels() const;

  // Spacing and physical properties
  const SpacingType &GetSpacing() const { return m_info.voxel_size; }
  void SetSpacing(const SpacingType &spacing) { m_info.voxel_size = spacing; }
  const OriginType &GetOrigin() const { return m_info.origin; }
  void SetOrigin(const OriginType &origin) { m_info.origin = origin; }

  // Image info
  const ImageInfo &GetImageInfo() const { return m_info; }
  void SetImageInfo(const ImageInfo &info) { m_info = info; }

  // Data manipulation
  void Fill(const PixelType &value);
  void Allocate(const SizeType &size);
  void Clear();
  bool IsValid() const { return m_is_valid; }

  // Raw data access
  PixelType *GetDataPointer() { return m_data.data(); }
  const PixelType *GetDataPointer() const { return m_data.data(); }
  std::vector<PixelType> &GetDataVector() { return m_data; }
  const std::vector<PixelType> &GetDataVector() const { return m_data; }

  // Coordinate transformations
  size_t IndexToLinear(const IndexType &index) const;
  IndexType LinearToIndex(size_t linear_index) const;
  bool IsIndexValid(const IndexType &index) const;

  // Statistics
  PixelType GetMinValue() const;
  PixelType GetMaxValue() const;

  // Label queries
  size_t CountNonZero() const;
  size_t CountValue(const PixelType &value) const;
  std::vector<PixelType> GetUniqueValues() const; // ascending, zero excluded
};

using LabelImage = Image3D<uint32_t>;
using OutputLabelImage = Image3D<uint16_t>;
using BinaryMaskImage = Image3D<uint8_t>;

/**
 * @brief Image format enumeration
 */
enum class ImageFormat {
  NIFTI_1, // NIfTI-1 format (.nii, .nii.gz)
  TIFF,    // Multi-page TIFF stack (.tif, .tiff)
  UNKNOWN
};

/**
 * @brief Image data type enumeration
 */
enum class DataType {
  UINT8,
  INT8,
  UINT16,
  INT16,
  UINT32,
  INT32,
  FLOAT32,
  FLOAT64,
  UNKNOWN
};

/**
 * @brief NIfTI-1 header (348 bytes)
 */
struct NiftiHeader {
  int32_t sizeof_hdr = 348;
  char data_type[10] = {0};
  char db_name[18] = {0};
  int32_t extents = 0;
  int16_t session_error = 0;
  char regular = 'r';
  char dim_info = 0;

  int16_t dim[8] = {0};
  float intent_p1 = 0.0f;
  float intent_p2 = 0.0f;
  float intent_p3 = 0.0f;
  int16_t intent_code = 0;
  int16_t datatype = 0;
  int16_t bitpix = 0;
  int16_t slice_start = 0;

  float pixdim[8] = {0.0f};
  float vox_offset = 352.0f;
  float scl_slope = 1.0f;
  float scl_inter = 0.0f;
  int16_t slice_end = 0;
  char slice_code = 0;
  char xyzt_units = 0;

  float cal_max = 0.0f;
  float cal_min = 0.0f;
  float slice_duration = 0.0f;
  float toffset = 0.0f;
  int32_t glmax = 0;
  int32_t glmin = 0;

  char descrip[80] = {0};
  char aux_file[24] = {0};

  int16_t qform_code = 0;
  int16_t sform_code = 0;

  float quatern_b = 0.0f;
  float quatern_c = 0.0f;
  float quatern_d = 0.0f;
  float qoffset_x = 0.0f;
  float qoffset_y = 0.0f;
  float qoffset_z = 0.0f;

  float srow_x[4] = {0.0f};
  float srow_y[4] = {0.0f};
  float srow_z[4] = {0.0f};

  char intent_name[16] = {0};
  char magic[4] = {'n', '+', '1', '\0'};
};

static_assert(sizeof(NiftiHeader) == 348, "NIfTI-1 header must be 348 bytes");

/**
 * @brief Read options for ImageReader
 */
struct ImageReadOptions {
  bool read_header_only = false;
  size_t memory_limit_mb = 0; // 0 = no limit
  bool verbose = false;
};

/**
 * @brief NIfTI-1 reader for integer label volumes
 */
class ImageReader {
public:
  using ReadOptions = ImageReadOptions;

private:
  std::string m_filename;
  ImageFormat m_format = ImageFormat::UNKNOWN;
  DataType m_datatype = DataType::UNKNOWN;
  NiftiHeader m_header;
  bool m_is_compressed = false;
  bool m_swap_bytes = false;

public:
  ImageReader() = default;
  explicit ImageReader(const std::string &filename);

  bool Open(const std::string &filename);
  void Close();

  // Format detection
  static ImageFormat DetectFormat(const std::string &filename);
  static bool IsNiftiFile(const std::string &filename);
  static bool IsTiffFile(const std::string &filename);
  static bool IsCompressed(const std::string &filename);

  bool ReadHeader();
  const NiftiHeader &GetHeader() const { return m_header; }
  DataType GetDataType() const { return m_datatype; }

  template <typename PixelType>
  std::unique_ptr<Image3D<PixelType>>
  ReadImage(const ReadOptions &options = ReadOptions{});

  std::unique_ptr<LabelImage>
  ReadLabelImage(const ReadOptions &options = ReadOptions{});

  std::array<size_t, 3> GetImageDimensions() const;
  std::array<double, 3> GetVoxelSize() const;
  size_t GetImageSizeBytes() const;
  std::string GetDescription() const;

  static size_t GetBytesPerPixel(DataType type);
  static DataType NiftiDataTypeToDataType(int16_t nifti_type);

private:
  bool ReadNiftiHeader();
  template <typename PixelType>
  bool ReadImageData(Image3D<PixelType> *image, const ReadOptions &options);

  std::vector<uint8_t> LoadFileData() const;
  std::vector<uint8_t> DecompressGzip(const std::string &filename) const;

  template <typename T> static void SwapEndianness(T &value);
};

/**
 * @brief Write options for ImageWriter
 */
struct ImageWriteOptions {
  bool compress = false;
  std::string description;
  bool verbose = false;
};

/**
 * @brief NIfTI-1 writer for integer label volumes
 */
class ImageWriter {
public:
  using WriteOptions = ImageWriteOptions;

private:
  std::string m_filename;
  ImageFormat m_format = ImageFormat::NIFTI_1;

public:
  ImageWriter() = default;
  explicit ImageWriter(const std::string &filename);

  bool Open(const std::string &filename,
            ImageFormat format = ImageFormat::UNKNOWN);
  void Close();

  template <typename PixelType>
  bool WriteImage(const Image3D<PixelType> &image,
                  const WriteOptions &options = WriteOptions{});

  ImageFormat GetFormat() const { return m_format; }

  static int16_t DataTypeToNiftiDataType(DataType type);
  template <typename PixelType> static DataType GetDataTypeFromPixelType();

private:
  bool WriteNiftiImage(const void *data, size_t data_size,
                       const NiftiHeader &header, const WriteOptions &options);

  template <typename PixelType>
  NiftiHeader CreateNiftiHeader(const Image3D<PixelType> &image,
                                const WriteOptions &options) const;
};

/**
 * @brief Multi-page TIFF stacks through ITK
 */
class TiffImageIO {
public:
  static bool CanReadFile(const std::string &filename);

  // Throws ImageIOException on failure
  static std::unique_ptr<LabelImage> ReadLabelImage(const std::string &filename);

  template <typename PixelType>
  static void WriteImage(const Image3D<PixelType> &image,
                         const std::string &filename, bool compress = true);
};

/**
 * @brief Format-independent helpers used by the pipeline
 */
namespace ImageUtils {
bool FileExists(const std::string &filename);
std::string GetFileExtension(const std::string &filename);

// Reads any supported format into a label volume. Throws ImageIOException.
std::unique_ptr<LabelImage> ReadLabelImage(const std::string &filename,
                                           bool verbose = false);

// Writes by extension. Throws ImageIOException.
template <typename PixelType>
void WriteImage(const Image3D<PixelType> &image, const std::string &filename,
                bool verbose = false);
} // namespace ImageUtils

/**
 * @brief Exception classes for image I/O
 */
class ImageIOException : public std::runtime_error {
public:
  explicit ImageIOException(const std::string &message)
      : std::runtime_error("ImageIO Error: " + message) {}
};

class UnsupportedFormatException : public ImageIOException {
public:
  explicit UnsupportedFormatException(const std::string &format)
      : ImageIOException("Unsupported format: " + format) {}
};

class FileNotFoundException : public ImageIOException {
public:
  explicit FileNotFoundException(const std::string &filename)
      : ImageIOException("File not found: " + filename) {}
};

class CorruptedFileException : public ImageIOException {
public:
  explicit CorruptedFileException(const std::string &filename)
      : ImageIOException("Corrupted file: " + filename) {}
};

} // namespace io
} // namespace neuroparcel

#endif // NEUROPARCEL_IMAGE_IO_H
