#include "payload/manifest.hpp"

#include "update_metadata.pb.h"
#include "util/overloaded.hpp"

namespace otadump {

namespace pb = update_metadata;

const PartitionUpdate* Manifest::FindPartition(const std::string& name) const {
    for (const auto& p : partitions) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

bool Manifest::IsIncremental() const {
    for (const auto& p : partitions) {
        if (p.old_size.has_value()) return true;
    }
    return false;
}

std::string OperationTypeName(std::uint32_t type) {
    if (pb::InstallOperation_Type_IsValid(static_cast<int>(type))) {
        return pb::InstallOperation_Type_Name(static_cast<pb::InstallOperation_Type>(type));
    }
    return "TYPE_" + std::to_string(type);
}

std::uint32_t OperationTypeOf(const InstallOperation& op) {
    return std::visit(
        Overloaded{
            [](const ReplaceOp& o) -> std::uint32_t {
                switch (o.codec) {
                    case ReplaceCodec::None:  return pb::InstallOperation::REPLACE;
                    case ReplaceCodec::Bzip2: return pb::InstallOperation::REPLACE_BZ;
                    case ReplaceCodec::Xz:    return pb::InstallOperation::REPLACE_XZ;
                    case ReplaceCodec::Zstd:  return pb::InstallOperation::REPLACE_ZSTD;
                }
                return pb::InstallOperation::REPLACE;
            },
            [](const ZeroOp& o) -> std::uint32_t {
                return o.discard ? pb::InstallOperation::DISCARD : pb::InstallOperation::ZERO;
            },
            [](const SourceCopyOp&) -> std::uint32_t { return pb::InstallOperation::SOURCE_COPY; },
            [](const DiffOp& o) -> std::uint32_t {
                switch (o.format) {
                    case DiffFormat::Bsdiff:       return pb::InstallOperation::SOURCE_BSDIFF;
                    case DiffFormat::BrotliBsdiff: return pb::InstallOperation::BROTLI_BSDIFF;
                    case DiffFormat::Puffdiff:     return pb::InstallOperation::PUFFDIFF;
                }
                return pb::InstallOperation::SOURCE_BSDIFF;
            },
            [](const UnsupportedOp& o) -> std::uint32_t { return o.type; },
        },
        op);
}

const ExtentList& DstExtentsOf(const InstallOperation& op) {
    return std::visit([](const auto& o) -> const ExtentList& { return o.dst_extents; }, op);
}

} // namespace otadump
