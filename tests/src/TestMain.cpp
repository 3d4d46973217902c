#include <gtest/gtest.h>
#include <wx/app.h>
#include <wx/init.h>
#include <wx/log.h>

#include <clocale>

class BatchRenamerTestApp : public wxAppConsole
{
public:
    virtual bool OnInit() override
    {
        if (!wxAppConsole::OnInit())
        {
            return false;
        }
        // Keep profile and settings tests away from the user's real configuration
        SetAppName("BatchRenamerTests");
        wxLog::SetLogLevel(wxLOG_Warning);
        // Character classification from the environment, as a desktop session would have
        if (!std::setlocale(LC_CTYPE, ""))
        {
            wxLogWarning("Environment locale unavailable; staying with the C locale.");
        }
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
        char appname[] = "batchrenamer_tests";
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
    ::testing::AddGlobalTestEnvironment(new WxWidgetsGlobalEnvironment);
    return RUN_ALL_TESTS();
}