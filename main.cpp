#include <QCoreApplication>
#include <QDebug>

#include "src/segment_ctor_test.h"
#include "src/segment_access_test.h"
#include "src/segment_search_test.h"
#include "src/segment_combine_test.h"


int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    int failed = 0;

    qDebug() << "\n" << "segment construction test";
    failed += run_tst_segment_ctor_api_paranoid(argc, argv);

    qDebug() << "\n" << "segment access test";
    failed += run_tst_segment_access_api_paranoid(argc, argv);

    qDebug() << "\n" << "segment search test";
    failed += run_tst_segment_search_api_paranoid(argc, argv);

    qDebug() << "\n" << "segment combine test";
    failed += run_tst_segment_combine_api_paranoid(argc, argv);

    return (failed == 0) ? 0 : 1;
}
