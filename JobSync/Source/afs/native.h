// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FS_NATIVE_183247018532434563465
#define FS_NATIVE_183247018532434563465

#include "abstract.h"


namespace jsync
{
//local disk: device root "/"
class NativeFileSystem : public AbstractFileSystem
{
public:
    NativeFileSystem() {}

    Zstring getNativePath(const AfsPath& itemPath) const { return zen::appendPath(rootPath_, itemPath.value); }

protected:
    //relative paths are resolved against the current working directory
    AfsPath getAfsPath(const Zstring& itemPath) const override;

    std::wstring getDisplayPath(const AfsPath& itemPath) const override { return zen::utfTo<std::wstring>(getNativePath(itemPath)); }

    std::weak_ordering compareDeviceSameAfsType(const AbstractFileSystem& /*afsRhs*/) const override { return std::weak_ordering::equivalent; } //single device

    //----------------------------------------------------------------------------------------------------------------
    std::optional<ItemType> getItemTypeIfExists(const AfsPath& itemPath) const override; //throw FileError

    uint64_t getFileSize(const AfsPath& filePath) const override; //throw FileError

    void createFolderPlain(const AfsPath& folderPath) const override; //throw FileError, ErrorTargetExisting

    void removeFilePlain   (const AfsPath& filePath  ) const override; //throw FileError
    void removeSymlinkPlain(const AfsPath& linkPath  ) const override; //throw FileError
    void removeFolderPlain (const AfsPath& folderPath) const override; //throw FileError

    void removeReadOnly(const AfsPath& itemPath) const override; //throw FileError

    //----------------------------------------------------------------------------------------------------------------
    std::unique_ptr<InputStream> getInputStream(const AfsPath& filePath) const override; //throw FileError

    std::unique_ptr<OutputStreamImpl> getOutputStream(const AfsPath& filePath, //throw FileError
                                                      std::optional<uint64_t> streamSize) const override;

    void traverseFolder(const AfsPath& folderPath, //throw FileError
                        const std::function<void(const FileInfo&    fi)>& onFile,
                        const std::function<void(const FolderInfo&  fi)>& onFolder,
                        const std::function<void(const SymlinkInfo& si)>& onSymlink) const override;

private:
    const Zstring rootPath_{Zstr("/")};
};
}

#endif //FS_NATIVE_183247018532434563465
