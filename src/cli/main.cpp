#include <QCoreApplication>

#include "cli/TunelogCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("tunelog"));

    tunelog::TunelogCli cli;
    return cli.run(argc, argv);
}
