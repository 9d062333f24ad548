/**
 * @file media_probe.hpp
 * @brief Container probing for resolved input assets
 */

#ifndef LOOPWEAVE_MEDIA_PROBE_HPP
#define LOOPWEAVE_MEDIA_PROBE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace loopweave {

/**
 * @brief Open a media file and record its duration and video geometry.
 *
 * @param path File to probe
 * @param kind Video requires a video stream, Audio an audio stream
 * @return Probed asset
 * @throws InputError if the file cannot be opened, has no stream of the
 *         requested kind, or reports no positive duration
 */
MediaAsset probe_media(const std::string &path, MediaKind kind);

/**
 * @brief Read the pixel size of an image file (PNG overlays).
 * @return Size from the image header, or std::nullopt if unreadable
 */
std::optional<Canvas> probe_image_size(const std::string &path);

} // namespace loopweave

#endif // LOOPWEAVE_MEDIA_PROBE_HPP
