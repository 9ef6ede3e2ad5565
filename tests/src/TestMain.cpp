#include "gtest/gtest.h"
#include <wx/app.h>
#include <wx/init.h>
#include <wx/log.h>
#include <cstring>

namespace
{
    // Set by --verbose-log to show the rename and split progress messages while tests run
    bool g_verboseLog = false;
}

class BatchRenamerTestApp : public wxAppConsole
{
public:
    virtual bool OnInit() override
    {
        if (!wxAppConsole::OnInit())
        {
            return false;
        }
        wxLog::SetVerbose(g_verboseLog);
        return true;
    }
};

wxIMPLEMENT_APP_NO_MAIN(BatchRenamerTestApp);

class WxWidgetsGlobalEnvironment : public ::testing::Environment
{
public:
    virtual void SetUp() override
    {
        wxApp::SetInstance(new BatchRenamerTestApp());
        char appname[] = "batch_renamer_tests";
        char *argv_[] = {appname, nullptr};
        int argc_ = 1;

        if (!wxEntryStart(argc_, argv_))
        {
            FAIL() << "wxEntryStart failed. wxWidgets could not be initialized for tests.";
            return;
        }

        if (wxTheApp)
        {
            if (!wxTheApp->CallOnInit())
            {
                FAIL() << "wxTheApp->CallOnInit() failed.";
                wxEntryCleanup();
            }
        }
        else
        {
            FAIL() << "wxTheApp is null after wxEntryStart. wxWidgets initialization incomplete.";
            wxEntryCleanup();
        }
    }

    virtual void TearDown() override
    {
        if (wxTheApp)
        {
            wxTheApp->OnExit();
        }
        wxEntryCleanup();
        wxApp::SetInstance(nullptr);
    }
};

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    for (int i = 1; i < argc; ++i)
    {
        if (std::strcmp(argv[i], "--verbose-log") == 0)
        {
            g_verboseLog = true;
        }
    }
    ::testing::AddGlobalTestEnvironment(new WxWidgetsGlobalEnvironment);
    return RUN_ALL_TESTS();
}