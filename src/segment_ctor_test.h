#ifndef SEGMENT_CTOR_TEST_H_
#define SEGMENT_CTOR_TEST_H_

int run_tst_segment_ctor_api_paranoid(int argc, char** argv);

#endif /* SEGMENT_CTOR_TEST_H_ */
