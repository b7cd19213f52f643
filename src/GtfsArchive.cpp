#include <utility>
#include "GtfsArchive.hpp"
#include "Errors.hpp"

GtfsArchive::GtfsArchive(std::string zipPath)
    : path(std::move(zipPath))
{
    mz_zip_zero_struct(&archive);

    if (!mz_zip_reader_init_file(&archive, path.c_str(), 0))
    {
        auto const err = mz_zip_get_last_error(&archive);
        throw NotFoundError("Could not open static archive " + path + ": "
                            + mz_zip_get_error_string(err));
    }
}

GtfsArchive::~GtfsArchive()
{
    mz_zip_reader_end(&archive);
}

int GtfsArchive::locate(std::string const& member)
{
    return mz_zip_reader_locate_file(&archive, member.c_str(), nullptr, MZ_ZIP_FLAG_IGNORE_PATH);
}

bool GtfsArchive::contains(std::string const& member)
{
    return locate(member) >= 0;
}

std::string GtfsArchive::read(std::string const& member)
{
    int const index = locate(member);
    if (index < 0)
        throw NotFoundError(path + " has no " + member);

    auto const fileIndex = static_cast<mz_uint>(index);

    mz_zip_archive_file_stat stat{};
    if (!mz_zip_reader_file_stat(&archive, fileIndex, &stat))
        throw DataFormatError("Cannot stat " + member + " in " + path);

    std::string content(static_cast<std::size_t>(stat.m_uncomp_size), '\0');
    if (!mz_zip_reader_extract_to_mem(&archive, fileIndex, content.data(), content.size(), 0))
    {
        auto const err = mz_zip_get_last_error(&archive);
        throw DataFormatError("Cannot extract " + member + " from " + path + ": "
                              + mz_zip_get_error_string(err));
    }

    return content;
}

CsvTable GtfsArchive::readTable(std::string const& member)
{
    return CsvTable::parse(member, read(member));
}
