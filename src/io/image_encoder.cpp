#include "io/image_encoder.hpp"
#include <fstream>
#include <iostream>
#include <boost/filesystem.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace fs = boost::filesystem;

namespace vacmap {

static const char *STAGE = "ImageEncoder";

cv::Mat upscale(const cv::Mat &image, int factor)
{
    if (factor <= 1 || image.empty()) return image.clone();

    cv::Mat out;
    cv::resize(image, out, cv::Size(image.cols * factor, image.rows * factor),
               0, 0, cv::INTER_LANCZOS4);
    return out;
}

bool encodePng(const cv::Mat &image, std::vector<uint8_t> &png, PipelineError &err)
{
    if (image.empty()) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, "", "empty image");
        return false;
    }

    try {
        if (!cv::imencode(".png", image, png)) {
            err.set(ErrorKind::ENCODE_FAILED, STAGE, "", "PNG encoder refused the image");
            return false;
        }
    } catch (const cv::Exception &e) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, "", e.what());
        return false;
    }
    return true;
}

std::string sidecarPath(const std::string &pngPath)
{
    fs::path p(pngPath);
    if (p.extension() == ".png")
        return p.replace_extension(".base64.txt").string();
    return pngPath + ".base64.txt";
}

static fs::path tempName(const fs::path &target)
{
    return target.parent_path() / fs::path(target.filename().string() + ".tmp");
}

static bool writeFile(const fs::path &path, const char *data, size_t size,
                      PipelineError &err)
{
    std::ofstream out(path.string(), std::ios::binary | std::ios::trunc);
    if (!out) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, path.string(), "cannot open for writing");
        return false;
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, path.string(), "short write");
        return false;
    }
    return true;
}

static void discard(const fs::path &path)
{
    boost::system::error_code ec;
    fs::remove(path, ec);
}

static void restore(const fs::path &backup, const fs::path &target)
{
    boost::system::error_code ec;
    fs::rename(backup, target, ec);
    if (ec)
        std::cerr << "[ImageEncoder] could not restore " << target.string()
                  << " from " << backup.string() << ": " << ec.message() << '\n';
}

static fs::path backupName(const fs::path &target)
{
    return target.parent_path() / fs::path(target.filename().string() + ".prev");
}

bool writeOutputs(const std::string &pngPath,
                  const std::vector<uint8_t> &png,
                  const std::string &base64,
                  PipelineError &err,
                  bool verbose)
{
    const fs::path pngTarget(pngPath);
    const fs::path txtTarget(sidecarPath(pngPath));

    boost::system::error_code ec;
    if (pngTarget.has_parent_path() && !fs::exists(pngTarget.parent_path(), ec)) {
        fs::create_directories(pngTarget.parent_path(), ec);
        if (ec) {
            err.set(ErrorKind::ENCODE_FAILED, STAGE, pngPath,
                    "cannot create output directory: " + ec.message());
            return false;
        }
    }

    // both temporaries must be complete before either file is replaced
    const fs::path pngTmp = tempName(pngTarget);
    const fs::path txtTmp = tempName(txtTarget);
    if (!writeFile(pngTmp, reinterpret_cast<const char *>(png.data()), png.size(), err)) {
        discard(pngTmp);
        return false;
    }
    if (!writeFile(txtTmp, base64.data(), base64.size(), err)) {
        discard(pngTmp);
        discard(txtTmp);
        return false;
    }

    // the previous PNG is parked until the sidecar is in place
    const fs::path pngPrev = backupName(pngTarget);
    bool hadPrevious = false;
    if (fs::is_regular_file(pngTarget, ec)) {
        fs::rename(pngTarget, pngPrev, ec);
        if (ec) {
            err.set(ErrorKind::ENCODE_FAILED, STAGE, pngPath,
                    "cannot move previous PNG aside: " + ec.message());
            discard(pngTmp);
            discard(txtTmp);
            return false;
        }
        hadPrevious = true;
    }

    fs::rename(pngTmp, pngTarget, ec);
    if (ec) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, pngPath, "rename failed: " + ec.message());
        discard(pngTmp);
        discard(txtTmp);
        if (hadPrevious) restore(pngPrev, pngTarget);
        return false;
    }

    fs::rename(txtTmp, txtTarget, ec);
    if (ec) {
        err.set(ErrorKind::ENCODE_FAILED, STAGE, txtTarget.string(),
                "rename failed: " + ec.message());
        discard(txtTmp);
        if (hadPrevious) restore(pngPrev, pngTarget);
        else discard(pngTarget);
        return false;
    }

    if (hadPrevious) discard(pngPrev);

    if (verbose)
        std::cout << "[ImageEncoder] wrote " << pngPath << " (" << png.size()
                  << " bytes) + " << txtTarget.string() << '\n';
    return true;
}

} // namespace vacmap
