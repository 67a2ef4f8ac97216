#include <gtest/gtest.h>
#include <QCoreApplication>

// LaunchService delivers results through the Qt event loop, so every test
// binary needs an application object.
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
