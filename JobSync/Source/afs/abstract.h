// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABSTRACT_H_873450978453042524534234
#define ABSTRACT_H_873450978453042524534234

#include <compare>
#include <functional>
#include <memory>
#include <vector>
#include <zen/file_error.h>
#include <zen/file_path.h>
#include <zen/stl_tools.h>


namespace jsync
{
struct AfsPath;
AfsPath sanitizeDeviceRelativePath(Zstring relPath);

class AbstractFileSystem;
class FileHandle;
class DirectoryHandle;

//==============================================================================================================
using AfsDevice = zen::SharedRef<const AbstractFileSystem>;

struct AfsPath //= path relative to the file system root folder (no leading/traling separator)
{
    AfsPath() {}
    explicit AfsPath(const Zstring& p) : value(p) { assert(zen::isValidRelPath(value)); }
    Zstring value;

    std::strong_ordering operator<=>(const AfsPath&) const = default;
};

struct AbstractPath //THREAD-SAFETY: like an int!
{
    AbstractPath(const AfsDevice& deviceIn, const AfsPath& pathIn) : afsDevice(deviceIn), afsPath(pathIn) {}

    AfsDevice afsDevice; //"const AbstractFileSystem" => all accesses expected to be thread-safe!!!
    AfsPath afsPath; //relative to device root
};

//incremental progress of a single file copy
struct CopyProgress
{
    uint64_t bytesTotal   = 0; //source file size
    uint64_t bytesCurrent = 0; //cumulative bytes written; restarts for each file

    bool operator==(const CopyProgress&) const = default;
};
using CopyProgressCallback = std::function<void(const CopyProgress& progress)>; //throw X

//one of "Item not found", "Access denied", "Path too long", "I/O error"
std::wstring getErrorCategory(const zen::FileError& e);

//==============================================================================================================

/*  Storage backend:
    - low-level primitives: protected/private virtuals, throw FileError
    - "try" operations: never throw on access failures, but log the categorized error (zen::logExtraError) and return false
    - create instances via zen::makeSharedRef<>() only: handles keep the backend alive!       */
class AbstractFileSystem : public std::enable_shared_from_this<AbstractFileSystem> //THREAD-SAFETY: "const" member functions must model thread-safe access!
{
public:
    //=============== convenience =================
    static Zstring getItemName(const AbstractPath& itemPath) { return getItemName(itemPath.afsPath); }
    static Zstring getItemName(const AfsPath& itemPath) { using namespace zen; return afterLast(itemPath.value, Zstr("/"), IfNotFoundReturn::all); }

    static AbstractPath appendRelPath(const AbstractPath& itemPath, const Zstring& relPath);

    static std::optional<AbstractPath> getParentPath(const AbstractPath& itemPath);
    static std::optional<AfsPath>      getParentPath(const AfsPath& itemPath);
    //=============================================

    static std::weak_ordering compareDevice(const AbstractFileSystem& lhs, const AbstractFileSystem& rhs);

    static std::wstring getDisplayPath(const AbstractPath& itemPath) { return itemPath.afsDevice.ref().getDisplayPath(itemPath.afsPath); }

    //----------------------------------------------------------------------------------------------------------------
    enum class ItemType : unsigned char
    {
        file,
        folder,
        symlink,
    };
    //distinguishes error/not existing
    static std::optional<ItemType> getItemTypeIfExists(const AbstractPath& itemPath) { return itemPath.afsDevice.ref().getItemTypeIfExists(itemPath.afsPath); } //throw FileError

    //symlink handling: follow
    static uint64_t getFileSize(const AbstractPath& filePath) { return filePath.afsDevice.ref().getFileSize(filePath.afsPath); } //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    //already existing: fail with ErrorTargetExisting
    //does NOT create parent directories recursively if not existing
    static void createFolderPlain(const AbstractPath& folderPath) { folderPath.afsDevice.ref().createFolderPlain(folderPath.afsPath); } //throw FileError

    //creates directories recursively if not existing
    static void createFolderIfMissingRecursion(const AbstractPath& folderPath); //throw FileError

    static void removeFolderIfExistsRecursion(const AbstractPath& folderPath); //throw FileError
    static void removeFileIfExists(const AbstractPath& filePath); //throw FileError

    static void removeFilePlain   (const AbstractPath& filePath  ) { filePath  .afsDevice.ref().removeFilePlain   (filePath  .afsPath); } //throw FileError
    static void removeSymlinkPlain(const AbstractPath& linkPath  ) { linkPath  .afsDevice.ref().removeSymlinkPlain(linkPath  .afsPath); } //
    static void removeFolderPlain (const AbstractPath& folderPath) { folderPath.afsDevice.ref().removeFolderPlain (folderPath.afsPath); } //

    //grant write access, e.g. before deletion
    static void removeReadOnly(const AbstractPath& itemPath) { itemPath.afsDevice.ref().removeReadOnly(itemPath.afsPath); } //throw FileError
    //----------------------------------------------------------------------------------------------------------------

    struct StreamAttributes
    {
        time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
        uint64_t fileSize = 0;
    };

    struct InputStream
    {
        virtual ~InputStream() {}
        virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError
        //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!

        //only returns attributes if they are already buffered within stream handle
        virtual std::optional<StreamAttributes> tryGetAttributesFast() = 0; //throw FileError
    };
    //return value always bound:
    static std::unique_ptr<InputStream> getInputStream(const AbstractPath& filePath) { return filePath.afsDevice.ref().getInputStream(filePath.afsPath); } //throw FileError

    //----------------------------------------------------------------------------------------------------------------
    struct OutputStreamImpl
    {
        virtual ~OutputStreamImpl() {}
        virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw FileError; may return short! CONTRACT: bytesToWrite > 0
        virtual void finalize() = 0; //throw FileError
    };

    class OutputStream //call finalize when done!
    {
    public:
        OutputStream(std::unique_ptr<OutputStreamImpl>&& outStream, const AbstractPath& filePath, std::optional<uint64_t> streamSize);
        ~OutputStream();
        size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError; may return short!
        void finalize(); //throw FileError

    private:
        OutputStream           (const OutputStream&) = delete;
        OutputStream& operator=(const OutputStream&) = delete;

        std::unique_ptr<OutputStreamImpl> outStream_; //bound!
        const AbstractPath filePath_;
        bool finalizeSucceeded_ = false;
        const std::optional<uint64_t> bytesExpected_;
        uint64_t bytesWrittenTotal_ = 0;
    };
    //already existing: overwrite
    static std::unique_ptr<OutputStream> getOutputStream(const AbstractPath& filePath, std::optional<uint64_t> streamSize) //throw FileError
    { return std::make_unique<OutputStream>(filePath.afsDevice.ref().getOutputStream(filePath.afsPath, streamSize), filePath, streamSize); }

    //----------------------------------------------------------------------------------------------------------------
    struct FileInfo
    {
        Zstring itemName;
        uint64_t fileSize = 0; //unit: bytes!
        time_t modTime = 0; //number of seconds since Jan. 1st 1970 GMT
    };

    struct FolderInfo
    {
        Zstring itemName;
    };

    struct SymlinkInfo
    {
        Zstring itemName;
    };

    //- non-recursive
    //- symlinks are not followed
    //- items are reported sorted by name
    static void traverseFolder(const AbstractPath& folderPath, //throw FileError
                               const std::function<void(const FileInfo&    fi)>& onFile,    //
                               const std::function<void(const FolderInfo&  fi)>& onFolder,  //optional
                               const std::function<void(const SymlinkInfo& si)>& onSymlink) //
    { folderPath.afsDevice.ref().traverseFolder(folderPath.afsPath, onFile, onFolder, onSymlink); }

    //stream-copy in chunks of COPY_BLOCK_SIZE; already existing target: overwrite
    //returns number of bytes written
    static uint64_t copyFileAsStream(const AbstractPath& sourcePath, const AbstractPath& targetPath, //throw FileError, X
                                     const CopyProgressCallback& onProgress /*throw X*/);

    static constexpr size_t COPY_BLOCK_SIZE = 256 * 1024;

    //================================================================================================================
    //backend operations: access failures are logged and reported via return value

    AfsDevice getDevice() const { return AfsDevice(shared_from_this()); }

    //no file access: a handle for a non-existing item is not an error
    FileHandle      getFileHandle     (const Zstring& itemPath) const;
    DirectoryHandle getDirectoryHandle(const Zstring& itemPath) const;

    //errors while checking read as "not existing"
    bool fileExists     (const Zstring& itemPath) const;
    bool directoryExists(const Zstring& itemPath) const;

    //return value always bound; handle must belong to this backend
    std::unique_ptr<InputStream> openInputStream(const FileHandle& file) const; //throw FileError

    //clears read-only attribute before deletion
    bool tryDeleteFile(const FileHandle& file) const;

    //create "targetDir/<name of sourceDir>"; already existing folder: success
    bool tryCreateDirectory(const DirectoryHandle& sourceDir, const DirectoryHandle& targetDir) const;

    //recursive deletion
    bool tryDeleteDirectory(const DirectoryHandle& dir) const;

    //copy "sourceFile" (belonging to "sourceFs") into "targetDir" (belonging to this backend)
    //- already existing target file: overwrite
    //- partially written target file is deleted on failure
    bool tryCopyFile(const AbstractFileSystem& sourceFs, const FileHandle& sourceFile, const DirectoryHandle& targetDir,
                     const CopyProgressCallback& onProgress /*throw X*/) const;

    //no need to protect access:
    virtual ~AbstractFileSystem() {}

protected:
    AbstractFileSystem() {}

    //map backend-specific path notation to device-relative path
    virtual AfsPath getAfsPath(const Zstring& itemPath) const = 0;

    virtual std::wstring getDisplayPath(const AfsPath& itemPath) const = 0;

    virtual std::weak_ordering compareDeviceSameAfsType(const AbstractFileSystem& afsRhs) const = 0;

    //----------------------------------------------------------------------------------------------------------------
    virtual std::optional<ItemType> getItemTypeIfExists(const AfsPath& itemPath) const = 0; //throw FileError

    virtual uint64_t getFileSize(const AfsPath& filePath) const = 0; //throw FileError

    //already existing: fail
    virtual void createFolderPlain(const AfsPath& folderPath) const = 0; //throw FileError

    virtual void removeFilePlain   (const AfsPath& filePath  ) const = 0; //throw FileError
    virtual void removeSymlinkPlain(const AfsPath& linkPath  ) const = 0; //throw FileError
    virtual void removeFolderPlain (const AfsPath& folderPath) const = 0; //throw FileError; non-recursive

    virtual void removeReadOnly(const AfsPath& itemPath) const = 0; //throw FileError

    //----------------------------------------------------------------------------------------------------------------
    virtual std::unique_ptr<InputStream> getInputStream(const AfsPath& filePath) const = 0; //throw FileError

    //already existing: overwrite
    virtual std::unique_ptr<OutputStreamImpl> getOutputStream(const AfsPath& filePath, //throw FileError
                                                              std::optional<uint64_t> streamSize) const = 0;
    //----------------------------------------------------------------------------------------------------------------
    virtual void traverseFolder(const AfsPath& folderPath, //throw FileError
                                const std::function<void(const FileInfo&    fi)>& onFile,
                                const std::function<void(const FolderInfo&  fi)>& onFolder,
                                const std::function<void(const SymlinkInfo& si)>& onSymlink) const = 0;

private:
    AbstractFileSystem           (const AbstractFileSystem&) = delete;
    AbstractFileSystem& operator=(const AbstractFileSystem&) = delete;

    void checkOwnDevice(const AbstractPath& itemPath) const; //throw std::logic_error
};


inline std::weak_ordering operator<=>(const AfsDevice& lhs, const AfsDevice& rhs) { return AbstractFileSystem::compareDevice(lhs.ref(), rhs.ref()); }
inline bool               operator== (const AfsDevice& lhs, const AfsDevice& rhs) { return (lhs <=> rhs) == std::weak_ordering::equivalent; }

inline
bool operator==(const AbstractPath& lhs, const AbstractPath& rhs) { return lhs.afsPath == rhs.afsPath && lhs.afsDevice == rhs.afsDevice; }

//==============================================================================================================

//value type identifying a file on a specific backend: no file access during construction
class FileHandle
{
public:
    explicit FileHandle(const AbstractPath& filePath) : filePath_(filePath) {}

    Zstring getName() const { return AbstractFileSystem::getItemName(filePath_); }
    std::wstring getFullPath() const { return AbstractFileSystem::getDisplayPath(filePath_); }

    bool exists() const; //errors while checking read as "not existing"

    uint64_t getFileSize() const { return AbstractFileSystem::getFileSize(filePath_); } //throw FileError

    const AbstractPath& getPath() const { return filePath_; }
    const AfsDevice& getDevice() const { return filePath_.afsDevice; }

private:
    AbstractPath filePath_;
};


//value type identifying a directory on a specific backend: no file access during construction
class DirectoryHandle
{
public:
    explicit DirectoryHandle(const AbstractPath& folderPath) : folderPath_(folderPath) {}

    Zstring getName() const { return AbstractFileSystem::getItemName(folderPath_); }
    std::wstring getFullPath() const { return AbstractFileSystem::getDisplayPath(folderPath_); }

    bool exists() const; //errors while checking read as "not existing"

    std::optional<DirectoryHandle> getParent() const; //no value for device root

    //direct children, sorted by name; symlinks are not reported
    std::vector<FileHandle>      getFiles      () const; //throw FileError
    std::vector<DirectoryHandle> getDirectories() const; //throw FileError

    //no file access: child items need not exist
    FileHandle      getChildFile     (const Zstring& itemName) const { return FileHandle     (AbstractFileSystem::appendRelPath(folderPath_, itemName)); }
    DirectoryHandle getChildDirectory(const Zstring& itemName) const { return DirectoryHandle(AbstractFileSystem::appendRelPath(folderPath_, itemName)); }

    const AbstractPath& getPath() const { return folderPath_; }
    const AfsDevice& getDevice() const { return folderPath_.afsDevice; }

private:
    AbstractPath folderPath_;
};








//------------------------------------ implementation -----------------------------------------
inline
AbstractPath AbstractFileSystem::appendRelPath(const AbstractPath& itemPath, const Zstring& relPath)
{
    return AbstractPath(itemPath.afsDevice, AfsPath(zen::appendPath(itemPath.afsPath.value, relPath)));
}


inline
FileHandle AbstractFileSystem::getFileHandle(const Zstring& itemPath) const
{
    return FileHandle(AbstractPath(getDevice(), getAfsPath(itemPath)));
}


inline
DirectoryHandle AbstractFileSystem::getDirectoryHandle(const Zstring& itemPath) const
{
    return DirectoryHandle(AbstractPath(getDevice(), getAfsPath(itemPath)));
}
}

#endif //ABSTRACT_H_873450978453042524534234
