#include "ImageIO.h"

#include <cstdio>
#include <limits>
#include <memory>
#include <regex>

namespace
{

const std::regex& frameFieldRegex ()
{
    static const std::regex re("%[0-9]*d");
    return re;
}

template <class T>
void copyTile (std::vector<unsigned char> const& buffer, Image& image, 
               int row0, int col0, int tile_height, int tile_width, int stride, bool vert_flip, int n_row)
{
    std::vector<T> data(buffer.size() / sizeof(T));
    std::memcpy(data.data(), buffer.data(), data.size() * sizeof(T));
    for (int i = 0; i < tile_height; i ++)
    {
        const int img_row = vert_flip ? n_row - 1 - (row0 + i) : row0 + i;
        for (int j = 0; j < tile_width; j ++)
        {
            image(img_row, col0 + j) = (double) data[i * stride + j];
        }
    }
}

template <class T>
T clampSample (double v)
{
    const double v_max = (double) std::numeric_limits<T>::max();
    if (v < 0) v = 0;
    if (v > v_max) v = v_max;
    return (T) (v + 0.5);
}

template <class T>
bool writeScanlines (TIFF* tif, Image const& image, int n_row, int n_col)
{
    std::vector<T> buf(n_col);
    for (int r = 0; r < n_row; ++r)
    {
        for (int c = 0; c < n_col; ++c)
        {
            buf[c] = clampSample<T>(image(r, c));
        }
        if (TIFFWriteScanline(tif, buf.data(), r, 0) < 0)
        {
            return false;
        }
    }
    return true;
}

}


bool hasFrameField (std::string const& pattern)
{
    return std::regex_search(pattern, frameFieldRegex());
}

std::string formatFrame (std::string const& pattern, int frame)
{
    std::smatch match;
    REQUIRE_CTX(std::regex_search(pattern, match, frameFieldRegex()), ErrorCode::ConfigurationError,
                "formatFrame: pattern has no %d field", pattern);

    char buf[64];
    std::snprintf(buf, sizeof(buf), match.str().c_str(), frame);
    return match.prefix().str() + buf + match.suffix().str();
}


Image ImageIO::loadImg (std::string const& file)
{
    std::unique_ptr<TIFF, void(*)(TIFF*)> tif(TIFFOpen(file.c_str(), "r"), TIFFClose);
    REQUIRE_CTX(tif != nullptr, ErrorCode::ImageLoadError,
                "ImageIO::loadImg: could not open image", file);

    // only grey-scale images
    std::uint16_t n_channel = 1;
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_SAMPLESPERPIXEL, &n_channel);
    _n_channel = n_channel;
    REQUIRE_CTX(_n_channel == 1, ErrorCode::UnsupportedType,
                "ImageIO::loadImg: colorful images are not supported", file);

    // check image size
    std::uint32_t n_row = 0, n_col = 0;
    IMAGEIO_CHECK_CALL(TIFFGetField(tif.get(), TIFFTAG_IMAGELENGTH, &n_row), file);
    IMAGEIO_CHECK_CALL(TIFFGetField(tif.get(), TIFFTAG_IMAGEWIDTH, &n_col), file);
    _n_row = int(n_row);
    _n_col = int(n_col);
    IMAGEIO_CHECK_CALL((_n_row > 0 && _n_col > 0), file);

    std::uint16_t bits_per_sample = 0;
    IMAGEIO_CHECK_CALL(TIFFGetField(tif.get(), TIFFTAG_BITSPERSAMPLE, &bits_per_sample), file);
    _bits_per_sample = bits_per_sample;
    IMAGEIO_CHECK_CALL((_bits_per_sample==8 || _bits_per_sample==16 || _bits_per_sample==32 || _bits_per_sample==64), file);

    // tiled or stripped
    _is_tiled = TIFFIsTiled(tif.get()) != 0;
    if (_is_tiled)
    {
        std::uint32_t tile_height = 0, tile_width = 0;
        IMAGEIO_CHECK_CALL(TIFFGetField(tif.get(), TIFFTAG_TILELENGTH, &tile_height), file);
        IMAGEIO_CHECK_CALL(TIFFGetField(tif.get(), TIFFTAG_TILEWIDTH, &tile_width), file);
        _tile_height0 = int(tile_height);
        _tile_width0 = int(tile_width);
        IMAGEIO_CHECK_CALL((_tile_height0>0 && _tile_height0<=TILE_MAX_HEIGHT && _tile_width0>0 && _tile_width0<=TILE_MAX_WIDTH), file);
    }
    else 
    {
        // read each scanline
        _tile_width0 = _n_col;
        _tile_height0 = 1;
    }

    const size_t bytes_per_row = (size_t(_n_channel) * _tile_width0 * _bits_per_sample + BITS_PER_BYTE - 1) / BITS_PER_BYTE;
    const size_t buffer_size = _tile_height0 * bytes_per_row;
    IMAGEIO_CHECK_CALL((buffer_size <= MAX_TILE_SIZE), file);
    std::vector<unsigned char> buffer(buffer_size);

    std::uint16_t orientation = ORIENTATION_TOPLEFT;
    TIFFGetFieldDefaulted(tif.get(), TIFFTAG_ORIENTATION, &orientation);
    _img_orientation = orientation;
    const bool vert_flip = _img_orientation == ORIENTATION_BOTLEFT || _img_orientation == ORIENTATION_BOTRIGHT 
                        || _img_orientation == ORIENTATION_LEFTBOT || _img_orientation == ORIENTATION_RIGHTBOT;

    Image image(_n_row, _n_col, 0);
    for (int row = 0; row < _n_row; row += _tile_height0)
    {
        const int tile_height = std::min(_tile_height0, _n_row - row);
        for (int col = 0; col < _n_col; col += _tile_width0)
        {
            const int tile_width = std::min(_tile_width0, _n_col - col);

            if (_is_tiled)
            {
                IMAGEIO_CHECK_CALL((TIFFReadTile(tif.get(), buffer.data(), col, row, 0, 0) >= 0), file);
            }
            else
            {
                IMAGEIO_CHECK_CALL((TIFFReadScanline(tif.get(), buffer.data(), row, 0) >= 0), file);
            }

            switch (_bits_per_sample)
            {
            case 8:
                copyTile<std::uint8_t>(buffer, image, row, col, tile_height, tile_width, _tile_width0, vert_flip, _n_row);
                break;
            case 16:
                copyTile<std::uint16_t>(buffer, image, row, col, tile_height, tile_width, _tile_width0, vert_flip, _n_row);
                break;
            case 32:
                copyTile<std::uint32_t>(buffer, image, row, col, tile_height, tile_width, _tile_width0, vert_flip, _n_row);
                break;
            case 64:
                copyTile<std::uint64_t>(buffer, image, row, col, tile_height, tile_width, _tile_width0, vert_flip, _n_row);
                break;
            default:
                break;
            }
        }
    }

    return image;
}

void ImageIO::saveImg (std::string const& save_path, Image const& image) const
{
    const int n_row = image.getDimRow();
    const int n_col = image.getDimCol();
    REQUIRE_CTX(n_row > 0 && n_col > 0, ErrorCode::InvalidArgument,
                "ImageIO::saveImg: empty image", save_path);

    std::unique_ptr<TIFF, void(*)(TIFF*)> tif(TIFFOpen(save_path.c_str(), "w"), TIFFClose);
    REQUIRE_CTX(tif != nullptr, ErrorCode::IOfailure,
                "ImageIO::saveImg: cannot open tiff for write", save_path);

    TIFFSetField(tif.get(), TIFFTAG_IMAGEWIDTH,      n_col);
    TIFFSetField(tif.get(), TIFFTAG_IMAGELENGTH,     n_row);
    TIFFSetField(tif.get(), TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tif.get(), TIFFTAG_ORIENTATION,     _img_orientation);
    TIFFSetField(tif.get(), TIFFTAG_PHOTOMETRIC,     PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif.get(), TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
    TIFFSetField(tif.get(), TIFFTAG_COMPRESSION,     COMPRESSION_NONE);
    TIFFSetField(tif.get(), TIFFTAG_BITSPERSAMPLE,   _bits_per_sample);

    const int bytes_per_row  = n_col * std::max(1, _bits_per_sample / BITS_PER_BYTE);
    const int rows_per_strip = std::max(1, (1<<16) / std::max(1, bytes_per_row));
    TIFFSetField(tif.get(), TIFFTAG_ROWSPERSTRIP, rows_per_strip);

    bool is_ok = false;
    switch (_bits_per_sample)
    {
    case 8:
        is_ok = writeScanlines<std::uint8_t>(tif.get(), image, n_row, n_col);
        break;
    case 16:
        is_ok = writeScanlines<std::uint16_t>(tif.get(), image, n_row, n_col);
        break;
    case 32:
        is_ok = writeScanlines<std::uint32_t>(tif.get(), image, n_row, n_col);
        break;
    default:
        THROW_FATAL_CTX(ErrorCode::UnsupportedType, "ImageIO::saveImg: unsupported bits per sample",
                        std::to_string(_bits_per_sample));
    }

    REQUIRE_CTX(is_ok, ErrorCode::IOfailure, "ImageIO::saveImg: failed to write scanline", save_path);
}

void ImageIO::setImgParam (ImageParam const& img_param)
{
    _n_row = img_param.n_row;
    _n_col = img_param.n_col;
    _bits_per_sample = img_param.bits_per_sample;
    _n_channel = img_param.n_channel;
    _img_orientation = img_param.img_orientation;
}

ImageParam ImageIO::getImgParam () const
{
    ImageParam img_param;
    img_param.n_row = _n_row;
    img_param.n_col = _n_col;
    img_param.bits_per_sample = _bits_per_sample;
    img_param.n_channel = _n_channel;
    img_param.img_orientation = _img_orientation;

    return img_param;
}


TiffImageSource::TiffImageSource (std::vector<std::string> const& img_base_list)
    : _img_base_list(img_base_list)
{
    for (auto const& base : _img_base_list)
    {
        REQUIRE_CTX(hasFrameField(base), ErrorCode::ConfigurationError,
                    "TiffImageSource: image base name needs a %d frame field", base);
    }
}

int TiffImageSource::getNumCam () const
{
    return int(_img_base_list.size());
}

std::string TiffImageSource::getImagePath (int cam_id, int frame) const
{
    REQUIRE_CTX(cam_id >= 0 && cam_id < getNumCam(), ErrorCode::OutOfRange,
                "TiffImageSource: camera id out of range", std::to_string(cam_id));
    return formatFrame(_img_base_list[cam_id], frame);
}

// one ImageIO per call, safe to use from several threads
Image TiffImageSource::getImage (int cam_id, int frame) const
{
    ImageIO io;
    return io.loadImg(getImagePath(cam_id, frame));
}


MemoryImageSource::MemoryImageSource (int n_cam)
    : _n_cam(n_cam)
{}

void MemoryImageSource::addImage (int cam_id, int frame, Image const& img)
{
    REQUIRE_CTX(cam_id >= 0 && cam_id < _n_cam, ErrorCode::OutOfRange,
                "MemoryImageSource::addImage: camera id out of range", std::to_string(cam_id));
    std::lock_guard<std::mutex> lock(_mutex);
    _img_map[{cam_id, frame}] = img;
}

int MemoryImageSource::getNumCam () const
{
    return _n_cam;
}

Image MemoryImageSource::getImage (int cam_id, int frame) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _img_map.find({cam_id, frame});
    if (it == _img_map.end())
    {
        THROW_FATAL_CTX(ErrorCode::ImageLoadError, "MemoryImageSource: no image",
                        "cam=" + std::to_string(cam_id) + " frame=" + std::to_string(frame));
    }
    return it->second;
}
