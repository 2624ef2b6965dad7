#include "ResultIO.h"
#include "ImageIO.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace
{

std::string formatLine (const char* fmt, ...)
{
    char buf[256];
    va_list args;
    va_start(args, fmt);
    const int len = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    REQUIRE(len >= 0 && len < int(sizeof(buf)), ErrorCode::OutOfRange, "ResultIO: record too long");
    return std::string(buf, len);
}

// first line is the record count
std::ifstream openCounted (std::string const& path, int& n_record)
{
    std::ifstream fin(path, std::ios::in);
    REQUIRE_CTX(fin.is_open(), ErrorCode::IOfailure, "ResultIO: cannot open file", path);
    REQUIRE_CTX(static_cast<bool>(fin >> n_record) && n_record >= 0, ErrorCode::IOfailure,
                "ResultIO: missing record count", path);
    return fin;
}

// "cam1_%04d.tif" -> "cam1_%04d", keeps "cam1.%d", "cam1." and "cam1.0001"
std::string stripImageExtension (std::string const& base)
{
    const std::string ext = fs::path(base).extension().string();
    if (ext.size() < 2 || ext.find('%') != std::string::npos)
    {
        return base;
    }
    bool is_number = true;
    for (size_t i = 1; i < ext.size(); i ++)
    {
        if (!std::isdigit(static_cast<unsigned char>(ext[i])))
        {
            is_number = false;
            break;
        }
    }
    return is_number ? base : fs::path(base).replace_extension().string();
}

}


std::string getTargetPath (std::string const& target_base, int frame)
{
    std::string base = stripImageExtension(target_base);
    if (hasFrameField(base))
    {
        static const std::regex re("%[0-9]*d");
        return formatFrame(std::regex_replace(base, re, "%04d", std::regex_constants::format_first_only), frame) 
               + "_targets";
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), ".%04d_targets", frame);
    return base + buf;
}

void writeFileAtomic (std::string const& path, std::string const& content)
{
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream fout(tmp_path, std::ios::out | std::ios::trunc);
        REQUIRE_CTX(fout.is_open(), ErrorCode::IOfailure, "ResultIO: cannot open file for write", tmp_path);
        fout << content;
        fout.flush();
        REQUIRE_CTX(fout.good(), ErrorCode::IOfailure, "ResultIO: write failed", tmp_path);
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec)
    {
        fs::remove(tmp_path, ec);
        THROW_FATAL_CTX(ErrorCode::IOfailure, "ResultIO: cannot rename temporary file", path);
    }
}

void writeTargets (std::string const& path, std::vector<Target> const& target_list)
{
    std::string content = formatLine("%d\n", int(target_list.size()));
    for (auto const& t : target_list)
    {
        content += formatLine("%4d %9.4f %9.4f %5d %5d %5d %5d %5d\n", 
                              t._pnr, t.x(), t.y(), t._n, t._nx, t._ny, t._sumg, t._tnr);
    }
    writeFileAtomic(path, content);
}

std::vector<Target> readTargets (std::string const& path)
{
    int n_record = 0;
    std::ifstream fin = openCounted(path, n_record);

    std::vector<Target> target_list;
    target_list.reserve(n_record);
    for (int i = 0; i < n_record; i ++)
    {
        Target t;
        double x, y;
        REQUIRE_CTX(static_cast<bool>(fin >> t._pnr >> x >> y >> t._n >> t._nx >> t._ny >> t._sumg >> t._tnr),
                    ErrorCode::IOfailure, "ResultIO: malformed target record", 
                    path + " record " + std::to_string(i));
        t._pt_center = Pt2D(x, y);
        target_list.push_back(t);
    }
    return target_list;
}

void writeRtis (std::string const& path, std::vector<Point3D> const& pt3d_list)
{
    std::string content = formatLine("%d\n", int(pt3d_list.size()));
    for (auto const& pt : pt3d_list)
    {
        content += formatLine("%4d %9.3f %9.3f %9.3f %4d %4d %4d %4d\n",
                              pt._id, pt._pt_center[0], pt._pt_center[1], pt._pt_center[2],
                              pt._pnr_list[0], pt._pnr_list[1], pt._pnr_list[2], pt._pnr_list[3]);
    }
    writeFileAtomic(path, content);
}

std::vector<Point3D> readRtis (std::string const& path)
{
    int n_record = 0;
    std::ifstream fin = openCounted(path, n_record);

    std::vector<Point3D> pt3d_list;
    pt3d_list.reserve(n_record);
    for (int i = 0; i < n_record; i ++)
    {
        Point3D pt;
        double x, y, z;
        REQUIRE_CTX(static_cast<bool>(fin >> pt._id >> x >> y >> z 
                                      >> pt._pnr_list[0] >> pt._pnr_list[1] >> pt._pnr_list[2] >> pt._pnr_list[3]),
                    ErrorCode::IOfailure, "ResultIO: malformed rt_is record", 
                    path + " record " + std::to_string(i));
        pt._pt_center = Pt3D(x, y, z);
        pt3d_list.push_back(pt);
    }
    return pt3d_list;
}

void writePtvis (std::string const& path, std::vector<PtvisRecord> const& record_list)
{
    std::string content = formatLine("%d\n", int(record_list.size()));
    for (auto const& rec : record_list)
    {
        content += formatLine("%4d %4d %10.3f %10.3f %10.3f\n",
                              rec.prev, rec.next, rec.pt[0], rec.pt[1], rec.pt[2]);
    }
    writeFileAtomic(path, content);
}

std::vector<PtvisRecord> readPtvis (std::string const& path)
{
    int n_record = 0;
    std::ifstream fin = openCounted(path, n_record);

    std::vector<PtvisRecord> record_list;
    record_list.reserve(n_record);
    for (int i = 0; i < n_record; i ++)
    {
        PtvisRecord rec;
        double x, y, z;
        REQUIRE_CTX(static_cast<bool>(fin >> rec.prev >> rec.next >> x >> y >> z),
                    ErrorCode::IOfailure, "ResultIO: malformed ptv_is record", 
                    path + " record " + std::to_string(i));
        rec.pt = Pt3D(x, y, z);
        record_list.push_back(rec);
    }
    return record_list;
}
