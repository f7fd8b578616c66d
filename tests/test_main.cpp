#include <gtest/gtest.h>
#include <QCoreApplication>

// QProcess, QSql 사용 테스트를 위한 앱 인스턴스
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
