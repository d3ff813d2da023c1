#include <gtest/gtest.h>

#include <QCoreApplication>

#include "pmxkit_config.h"

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("pmx_probe");
  QCoreApplication::setApplicationVersion(PMXKIT_VERSION);

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
