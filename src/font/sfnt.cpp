/*
 * sfnt.cpp — TrueType subsetting for embedded CID fonts
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sfnt.h"

#include <QCryptographicHash>
#include <QtEndian>

#include <hb.h>
#include <hb-subset.h>

#include <memory>

namespace sfnt {

namespace {

struct HbBlobDeleter {
    void operator()(hb_blob_t *b) const { if (b) hb_blob_destroy(b); }
};
struct HbFaceDeleter {
    void operator()(hb_face_t *f) const { if (f) hb_face_destroy(f); }
};
struct HbSubsetInputDeleter {
    void operator()(hb_subset_input_t *i) const { if (i) hb_subset_input_destroy(i); }
};

} // anonymous namespace

SubsetResult subsetFace(const QByteArray &fontData, const QList<uint> &glyphIds,
                        int faceIndex)
{
    SubsetResult result;

    std::unique_ptr<hb_blob_t, HbBlobDeleter> blob(
        hb_blob_create(fontData.constData(), static_cast<unsigned int>(fontData.size()),
                       HB_MEMORY_MODE_READONLY, nullptr, nullptr));
    if (!blob)
        return result;

    std::unique_ptr<hb_face_t, HbFaceDeleter> face(
        hb_face_create(blob.get(), static_cast<unsigned int>(faceIndex)));
    if (!face)
        return result;

    std::unique_ptr<hb_subset_input_t, HbSubsetInputDeleter> input(
        hb_subset_input_create_or_fail());
    if (!input)
        return result;

    hb_set_t *glyphSet = hb_subset_input_glyph_set(input.get());
    if (!glyphSet)
        return result;

    hb_set_add(glyphSet, 0);
    for (uint gid : glyphIds)
        hb_set_add(glyphSet, gid);

    uint32_t flags = static_cast<uint32_t>(hb_subset_input_get_flags(input.get()));
    flags |= HB_SUBSET_FLAGS_RETAIN_GIDS;
    flags |= HB_SUBSET_FLAGS_NAME_LEGACY;
    hb_subset_input_set_flags(input.get(), flags);

    std::unique_ptr<hb_face_t, HbFaceDeleter> subset(
        hb_subset_or_fail(face.get(), input.get()));
    if (!subset)
        return result;

    std::unique_ptr<hb_blob_t, HbBlobDeleter> subsetBlob(
        hb_face_reference_blob(subset.get()));
    if (!subsetBlob)
        return result;

    unsigned int length = 0;
    const char *data = hb_blob_get_data(subsetBlob.get(), &length);
    if (!data || length == 0)
        return result;

    result.fontData = QByteArray(data, static_cast<int>(length));
    result.success = true;
    return result;
}

QByteArray subsetTag(const QList<uint> &glyphIds)
{
    QCryptographicHash hash(QCryptographicHash::Md5);
    for (uint gid : glyphIds) {
        const quint32 be = qToBigEndian(static_cast<quint32>(gid));
        hash.addData(QByteArrayView(reinterpret_cast<const char *>(&be), sizeof(be)));
    }
    const QByteArray digest = hash.result();
    QByteArray tag;
    for (int i = 0; i < 6; ++i)
        tag.append(static_cast<char>('A' + static_cast<uchar>(digest.at(i)) % 26));
    return tag + '+';
}

} // namespace sfnt
