#include <QCoreApplication>
#include <QDebug>

#include "src/segment_bench.h"


int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    qDebug() << "\n" << "segment bench";
    const int failed = run_segment_bench();
    if (failed != 0) {
        qWarning().noquote() << "[segment_bench]" << failed << "scenario(s) FAILED";
        return 1;
    }
    return 0;
}
