#ifndef IMAGEIO_H
#define IMAGEIO_H

#include <cstdint>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <tiffio.h>

#include "Matrix.h"
#include "PTVCommons.h"

#define BITS_PER_BYTE 8
#define TILE_MAX_HEIGHT 4096
#define TILE_MAX_WIDTH 4096
#define MAX_TILE_SIZE (TILE_MAX_HEIGHT * TILE_MAX_WIDTH * 8)

// fails the current image with ImageLoadError, the file name as context
#define IMAGEIO_CHECK_CALL(call, file)                                            \
    REQUIRE_CTX((call), ErrorCode::ImageLoadError,                              \
                "ImageIO: check failed: " #call, (file))

struct ImageParam
{
    int n_row = 0;
    int n_col = 0;
    int bits_per_sample = 8;
    int n_channel = 1;
    std::uint16_t img_orientation = ORIENTATION_TOPLEFT;
};

// Expand the first printf integer conversion (%d, %04d, ...) of pattern with frame.
// Throws ConfigurationError when pattern has none.
bool hasFrameField (std::string const& pattern);
std::string formatFrame (std::string const& pattern, int frame);

// Grey-scale TIFF reader/writer (8/16/32/64 bit, stripped or tiled)
class ImageIO
{
public:
    ImageIO () {};
    ~ImageIO () {};

    // Throws FatalError(ImageLoadError) when the file cannot be read
    Image loadImg (std::string const& file);
    void saveImg (std::string const& save_path, Image const& image) const;

    void setImgParam (ImageParam const& img_param);
    ImageParam getImgParam () const;

private:
    int _n_row = 0;
    int _n_col = 0;
    int _bits_per_sample = 8;
    int _n_channel = 1;
    bool _is_tiled = false;
    int _tile_height0 = 0;
    int _tile_width0 = 0;
    std::uint16_t _img_orientation = ORIENTATION_TOPLEFT;
};


// Supplies the image of one camera at one frame.
// getImage is called concurrently from the sequence frame loop.
class ImageSource
{
public:
    virtual ~ImageSource () = default;

    virtual int getNumCam () const = 0;
    // Throws FatalError(ImageLoadError) if the image is unavailable
    virtual Image getImage (int cam_id, int frame) const = 0;
};

// Images on disk, one printf-style file pattern per camera (e.g. "img/cam1.%d")
class TiffImageSource : public ImageSource
{
public:
    explicit TiffImageSource (std::vector<std::string> const& img_base_list);

    int getNumCam () const override;
    Image getImage (int cam_id, int frame) const override;
    std::string getImagePath (int cam_id, int frame) const;

private:
    std::vector<std::string> _img_base_list;
};

// Images held in memory, keyed by (camera, frame)
class MemoryImageSource : public ImageSource
{
public:
    explicit MemoryImageSource (int n_cam);

    void addImage (int cam_id, int frame, Image const& img);

    int getNumCam () const override;
    Image getImage (int cam_id, int frame) const override;

private:
    int _n_cam = 0;
    std::map<std::pair<int,int>, Image> _img_map;
    mutable std::mutex _mutex;
};

#endif
