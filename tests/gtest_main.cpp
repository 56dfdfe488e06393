#include <QCoreApplication>
#include <gtest/gtest.h>

// The scheduler owns a QTimer, which needs an application object.
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
