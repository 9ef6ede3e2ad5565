#pragma once
#include "gtest/gtest.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error> // For std::error_code
#include <vector>
#include <wx/log.h>

namespace fs = std::filesystem;

// Collects wxLog output while in scope; the previous log target is restored afterwards
class LogCapture : public wxLog
{
public:
    LogCapture() : m_previous(wxLog::SetActiveTarget(this)) {}
    ~LogCapture() override { wxLog::SetActiveTarget(m_previous); }

    bool Contains(const std::string &text) const
    {
        for (const auto &message : messages)
        {
            if (message.find(text) != std::string::npos)
                return true;
        }
        return false;
    }

    std::vector<std::string> messages;

protected:
    void DoLogRecord(wxLogLevel WXUNUSED(level), const wxString &msg, const wxLogRecordInfo &WXUNUSED(info)) override
    {
        messages.push_back(std::string(msg.utf8_str()));
    }

private:
    wxLog *m_previous;
};

class BatchRenamerFilesystemTest : public ::testing::Test
{
protected:
    fs::path tempTestDir;

    void SetUp() override
    {
        // One directory per test so separately launched tests never share files
        const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempTestDir = fs::temp_directory_path() / "BatchRenamerGTests_FS" / (std::string(info->test_suite_name()) + "." + info->name());
        std::error_code ec;
        fs::remove_all(tempTestDir, ec); // Clean up from previous runs
        fs::create_directories(tempTestDir, ec);
        if (ec)
        {
            FAIL() << "Failed to create temporary test directory: " << tempTestDir.string() << " Error: " << ec.message();
        }
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(tempTestDir, ec); // Clean up
    }

    void CreateDummyFile(const fs::path &path, const std::string &content = "")
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                FAIL() << "Failed to create parent directory for dummy file: " << path.parent_path().string() << " Error: " << ec.message();
            }
        }
        std::ofstream outfile(path);
        if (!outfile)
        {
            FAIL() << "Failed to open dummy file for writing: " << path.string();
        }
        if (!content.empty())
        {
            outfile << content;
        }
        outfile.close();
    }

    void WriteBinaryFile(const fs::path &path, const std::string &content)
    {
        CreateDummyFile(path);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out)
        {
            ADD_FAILURE() << "Failed to write " << path.string();
        }
    }

    std::string ReadFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};
