#include <gtest/gtest.h>

#include "PCH.h"

#include <QCoreApplication>

namespace
{

int g_argc = 1;
char g_appName[] = "arkview_tests";
char *g_argv[] = {g_appName, nullptr};

// QCommandLineParser / QStandardPaths / QTimer 需要一个 QCoreApplication
class QtEnvironment : public ::testing::Environment
{
public:
    void SetUp() override
    {
        if (!QCoreApplication::instance())
        {
            m_app = std::make_unique<QCoreApplication>(g_argc, g_argv);
            QCoreApplication::setOrganizationName("ArkviewTests");
            QCoreApplication::setApplicationName("arkview_tests");
        }
        spdlog::set_level(spdlog::level::off);
    }

    void TearDown() override
    {
        m_app.reset();
    }

private:
    std::unique_ptr<QCoreApplication> m_app;
};

[[maybe_unused]] ::testing::Environment *const g_qtEnv = ::testing::AddGlobalTestEnvironment(new QtEnvironment);

} // namespace
