#ifndef SEGMENT_ACCESS_TEST_H_
#define SEGMENT_ACCESS_TEST_H_

int run_tst_segment_access_api_paranoid(int argc, char** argv);

#endif /* SEGMENT_ACCESS_TEST_H_ */
