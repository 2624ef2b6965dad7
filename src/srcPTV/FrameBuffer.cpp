#include "FrameBuffer.h"

#include <filesystem>
#include <iostream>

FrameBuffer::FrameBuffer (PTVSetting const& setting)
{
    const std::vector<int> frames = setting.getFrameList();
    _frame_list.reserve(frames.size());
    for (int frame : frames)
    {
        const std::string path = setting.getRtisPath(frame);
        REQUIRE_CTX(std::filesystem::exists(path), ErrorCode::ConfigurationError,
                    "FrameBuffer: missing rt_is file", path);

        FrameData data;
        data.frame = frame;
        data.pt3d_list = readRtis(path);
        data.path_list.assign(data.pt3d_list.size(), PathInfo());
        _frame_list.push_back(std::move(data));
    }
}

FrameBuffer::FrameBuffer (std::vector<int> const& frame_list, std::vector<std::vector<Point3D>> const& pt3d_lists)
{
    REQUIRE_CTX(frame_list.size() == pt3d_lists.size(), ErrorCode::InvalidArgument,
                "FrameBuffer: frame list and point lists differ in size",
                std::to_string(frame_list.size()) + " vs " + std::to_string(pt3d_lists.size()));

    _frame_list.reserve(frame_list.size());
    for (size_t i = 0; i < frame_list.size(); i ++)
    {
        REQUIRE_CTX(i == 0 || frame_list[i] > frame_list[i-1], ErrorCode::InvalidArgument,
                    "FrameBuffer: frames must be increasing", std::to_string(frame_list[i]));
        FrameData data;
        data.frame = frame_list[i];
        data.pt3d_list = pt3d_lists[i];
        data.path_list.assign(data.pt3d_list.size(), PathInfo());
        _frame_list.push_back(std::move(data));
    }
}

int FrameBuffer::getFrame (int fid) const
{
    return at(fid).frame;
}

FrameData& FrameBuffer::at (int fid)
{
    REQUIRE_CTX(fid >= 0 && fid < getNumFrame(), ErrorCode::OutOfRange,
                "FrameBuffer: frame position out of range", std::to_string(fid));
    return _frame_list[fid];
}

FrameData const& FrameBuffer::at (int fid) const
{
    REQUIRE_CTX(fid >= 0 && fid < getNumFrame(), ErrorCode::OutOfRange,
                "FrameBuffer: frame position out of range", std::to_string(fid));
    return _frame_list[fid];
}

Pt3D const& FrameBuffer::getPt (int fid, int id) const
{
    return _frame_list[fid].pt3d_list[id]._pt_center;
}

PathInfo const& FrameBuffer::getPath (int fid, int id) const
{
    return _frame_list[fid].path_list[id];
}

bool FrameBuffer::link (int fid_from, int id_from, int fid_to, int id_to)
{
    REQUIRE_CTX(fid_from < fid_to, ErrorCode::InvalidArgument, "FrameBuffer::link: link must go forward in time",
                std::to_string(fid_from) + " -> " + std::to_string(fid_to));

    PathInfo& from = at(fid_from).path_list.at(id_from);
    PathInfo& to = at(fid_to).path_list.at(id_to);
    if (from.hasNext() || to.hasPrev())
    {
        return false;
    }

    from.next_fid = fid_to;
    from.next_id = id_to;
    to.prev_fid = fid_from;
    to.prev_id = id_from;
    return true;
}

int FrameBuffer::countLinks () const
{
    int n = 0;
    for (auto const& data : _frame_list)
    {
        for (auto const& path : data.path_list)
        {
            if (path.hasNext()) n ++;
        }
    }
    return n;
}

std::vector<std::vector<PtvisRecord>> FrameBuffer::makePtvisRecords () const
{
    const int n_frame = getNumFrame();
    std::vector<std::vector<PtvisRecord>> record_list(n_frame);

    // one record per point, in rt_is order
    for (int fid = 0; fid < n_frame; fid ++)
    {
        auto const& data = _frame_list[fid];
        record_list[fid].resize(data.pt3d_list.size());
        for (size_t id = 0; id < data.pt3d_list.size(); id ++)
        {
            record_list[fid][id].pt = data.pt3d_list[id]._pt_center;
        }
    }

    // links, gaps go through interpolated records
    for (int fid = 0; fid < n_frame; fid ++)
    {
        auto const& data = _frame_list[fid];
        for (int id = 0; id < int(data.path_list.size()); id ++)
        {
            PathInfo const& path = data.path_list[id];
            if (!path.hasNext()) continue;

            const int fid_to = path.next_fid;
            const int span = fid_to - fid;
            Pt3D const& pt_from = data.pt3d_list[id]._pt_center;
            Pt3D const& pt_to = _frame_list[fid_to].pt3d_list[path.next_id]._pt_center;

            int cur_fid = fid;
            int cur_id = id;
            for (int k = 1; k < span; k ++)
            {
                PtvisRecord rec;
                rec.pt = pt_from + (pt_to - pt_from) * (double(k) / span);
                rec.prev = cur_id;
                record_list[fid + k].push_back(rec);

                const int new_id = int(record_list[fid + k].size()) - 1;
                record_list[cur_fid][cur_id].next = new_id;
                cur_fid = fid + k;
                cur_id = new_id;
            }
            record_list[cur_fid][cur_id].next = path.next_id;
            record_list[fid_to][path.next_id].prev = cur_id;
        }
    }

    return record_list;
}

void FrameBuffer::writePtvis (PTVSetting const& setting) const
{
    std::vector<std::vector<PtvisRecord>> record_list = makePtvisRecords();
    for (int fid = 0; fid < getNumFrame(); fid ++)
    {
        ::writePtvis(setting.getPtvisPath(_frame_list[fid].frame), record_list[fid]);
    }
}
