#include "datachunk/build_info.h"

#include "datachunk/build_info_generated.h"

namespace datachunk {

const BuildInfo&
build_info() noexcept
{
    static constexpr BuildInfo kInfo = {
        DATACHUNK_BUILDINFO_VERSION,
        DATACHUNK_BUILDINFO_BUILD_TYPE,
        DATACHUNK_BUILDINFO_COMPILER,
        DATACHUNK_BUILDINFO_PLATFORM,
        DATACHUNK_BUILDINFO_OPENSSL_VERSION,
#if defined(DATACHUNK_BUILD_LINKAGE_SHARED)
        true,
#else
        false,
#endif
        DATACHUNK_BUILDINFO_WITH_PYTHON != 0,
        DATACHUNK_BUILDINFO_WITH_FUZZERS != 0,
    };
    return kInfo;
}


std::string
build_info_summary(const BuildInfo& info)
{
    std::string out = "datachunk ";
    out.append(info.version);
    out.append(" (");
    out.append(info.build_type.empty() ? std::string_view("unspecified")
                                       : info.build_type);
    out.append(info.shared_library ? ", shared) " : ", static) ");
    out.append(info.compiler);
    out.push_back(' ');
    out.append(info.platform);
    if (!info.digest_backend.empty()) {
        out.append(", OpenSSL ");
        out.append(info.digest_backend);
    }
    if (info.with_python) {
        out.append(" +python");
    }
    if (info.with_fuzzers) {
        out.append(" +fuzzers");
    }
    return out;
}


std::string
build_info_summary()
{
    return build_info_summary(build_info());
}

}  // namespace datachunk
